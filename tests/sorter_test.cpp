#include "dirls/sorter.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace dirls {
namespace {

using test::make_entry;
using test::make_entry_at;

std::vector<std::string> names_of(const std::vector<Entry>& entries) {
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.name());
    }
    return names;
}

std::chrono::system_clock::time_point at(int seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

TEST(SorterTest, SortsByNameCaseInsensitively) {
    std::vector<Entry> entries{make_entry("Cherry.txt"), make_entry("banana.txt"), make_entry("Apple.txt")};
    sort_entries(entries, SortConfig{});
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"Apple.txt", "banana.txt", "Cherry.txt"}));
}

TEST(SorterTest, NamesDifferingOnlyByCaseKeepInputOrder) {
    std::vector<Entry> entries{make_entry("b"), make_entry("README"), make_entry("a"), make_entry("readme")};
    sort_entries(entries, SortConfig{});
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"a", "b", "README", "readme"}));

    std::vector<Entry> swapped{make_entry("readme"), make_entry("README")};
    sort_entries(swapped, SortConfig{});
    EXPECT_EQ(names_of(swapped), (std::vector<std::string>{"readme", "README"}));
}

TEST(SorterTest, NameSortIsIdempotent) {
    std::vector<Entry> entries{make_entry("zeta"), make_entry("Alpha"), make_entry("alpha"), make_entry("Mid")};
    sort_entries(entries, SortConfig{});
    const auto once = names_of(entries);
    sort_entries(entries, SortConfig{});
    EXPECT_EQ(names_of(entries), once);
}

TEST(SorterTest, SortsByTimeNewestFirst) {
    std::vector<Entry> entries{make_entry_at("old", at(100)), make_entry_at("new", at(300)),
        make_entry_at("middle", at(200))};
    sort_entries(entries, SortConfig{.by_time = true});
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"new", "middle", "old"}));
}

TEST(SorterTest, ReversedTimeSortIsOldestFirst) {
    std::vector<Entry> entries{make_entry_at("old", at(100)), make_entry_at("new", at(300)),
        make_entry_at("middle", at(200))};
    sort_entries(entries, SortConfig{.by_time = true, .reverse = true});
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"old", "middle", "new"}));
}

TEST(SorterTest, ReversedNameSort) {
    std::vector<Entry> entries{make_entry("apple"), make_entry("Cherry"), make_entry("banana")};
    sort_entries(entries, SortConfig{.reverse = true});
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"Cherry", "banana", "apple"}));
}

TEST(SorterTest, ReverseKeepsTiesInInputOrder) {
    std::vector<Entry> entries{make_entry_at("first", at(50)), make_entry_at("second", at(50)),
        make_entry_at("newer", at(60))};
    sort_entries(entries, SortConfig{.by_time = true, .reverse = true});
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"first", "second", "newer"}));
}

TEST(SorterTest, MissingTimeSortsAsEpoch) {
    std::vector<Entry> entries{make_entry("unknown"), make_entry_at("recent", at(10)),
        make_entry_at("before-epoch", at(-10))};
    sort_entries(entries, SortConfig{.by_time = true});
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"recent", "unknown", "before-epoch"}));
}

TEST(SorterTest, SubdirectoriesUseCaseSensitiveOrder) {
    std::vector<Entry> entries{make_entry("beta"), make_entry("Zulu"), make_entry("alpha"), make_entry("Alpha")};
    std::vector<std::reference_wrapper<const Entry>> dirs(entries.begin(), entries.end());
    sort_subdirectories(dirs);

    std::vector<std::string> names;
    for (const Entry& entry : dirs) {
        names.push_back(entry.name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"Alpha", "Zulu", "alpha", "beta"}));
}

} // namespace
} // namespace dirls

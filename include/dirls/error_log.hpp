#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <system_error>
#include <vector>

namespace dirls {

enum class ErrorKind {
    NotFound,
    Unreadable,
    EntryMetadata,
};

struct PathError {
    std::filesystem::path path;
    ErrorKind kind{ErrorKind::Unreadable};
    std::error_code code;
};

// Classifies an open/stat failure on a requested path.
[[nodiscard]] ErrorKind classify_path_error(const std::error_code& ec) noexcept;

class ErrorLog {
public:
    void record(std::filesystem::path path, ErrorKind kind, std::error_code code);

    // Writes one "dirls: <path>: <message>" line per error, then clears.
    void flush(std::ostream& os);

    [[nodiscard]] const std::vector<PathError>& errors() const noexcept { return errors_; }
    [[nodiscard]] bool empty() const noexcept { return errors_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return errors_.size(); }

private:
    std::vector<PathError> errors_;
};

} // namespace dirls

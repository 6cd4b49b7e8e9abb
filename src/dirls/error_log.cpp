#include "dirls/error_log.hpp"

#include <utility>

namespace dirls {

ErrorKind classify_path_error(const std::error_code& ec) noexcept {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ErrorKind::NotFound;
    }
    return ErrorKind::Unreadable;
}

void ErrorLog::record(std::filesystem::path path, ErrorKind kind, std::error_code code) {
    errors_.push_back(PathError{std::move(path), kind, code});
}

void ErrorLog::flush(std::ostream& os) {
    for (const auto& error : errors_) {
        os << "dirls: " << error.path.string() << ": " << error.code.message() << '\n';
    }
    errors_.clear();
}

} // namespace dirls

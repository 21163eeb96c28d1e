#pragma once

#include "ferry/http_message.hpp"
#include "ferry/router.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ferry {

struct FileHandlerOptions {
    /// POST writes the request body to the target file, creating or truncating it.
    bool allow_upload{true};
    /// DELETE removes the target file.
    bool allow_delete{true};
    /// GET on a directory without an index file renders a listing instead of 403.
    bool directory_listing{true};
    /// Served for a directory when present inside it.
    std::string index_file{"index.html"};
};

/// Outcome of a Range header against a file of known size. Only single byte ranges are
/// understood.
struct ByteRange {
    enum class State : std::uint8_t {
        None,
        Valid,
        Invalid,
        Unsatisfiable,
    };

    State state{State::None};
    std::uint64_t offset{0};
    std::uint64_t length{0};
};

/// Parses "bytes=first-last", "bytes=first-" or "bytes=-suffix". \a last is inclusive
/// and clamped to the end of the file.
ByteRange parse_byte_range(std::string_view header, std::uint64_t file_size);

/// "512 B", "1.5 KiB", "12.0 MiB".
std::string format_size(std::uintmax_t size);

/// Serves a directory tree: GET/HEAD read files (with byte ranges) or list directories,
/// POST uploads and DELETE removes. A missing file may be found with an .html or .php
/// suffix. Paths never resolve outside the root.
class FileHandler {
public:
    explicit FileHandler(std::filesystem::path root, FileHandlerOptions options = {});

    HttpResponse operator()(const HttpRequest& request) const;

    /// GET and HEAD, plus POST and DELETE when enabled.
    MethodSet methods() const;

    const std::filesystem::path& root() const { return root_; }

private:
    /// Maps the decoded request path under the root; nullopt if it climbs out.
    std::optional<std::filesystem::path> resolve(std::string_view path) const;

    HttpResponse read(const HttpRequest& request, std::filesystem::path target) const;
    HttpResponse serve_file(const HttpRequest& request, const std::filesystem::path& target) const;
    HttpResponse list_directory(const HttpRequest& request, const std::filesystem::path& dir) const;
    HttpResponse upload(const HttpRequest& request, const std::filesystem::path& target) const;
    HttpResponse remove(const std::filesystem::path& target) const;

    std::filesystem::path root_;
    FileHandlerOptions options_;
};

}  // namespace ferry

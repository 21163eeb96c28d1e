#include "ferry/file_handler.hpp"
#include "ferry/log.hpp"
#include "ferry/url.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace ferry {

namespace fs = std::filesystem;

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::optional<std::uint64_t> parse_offset(std::string_view s) {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

/// Decoded path split on '/', without empty and "." segments.
std::vector<std::string_view> path_segments(std::string_view path) {
    std::vector<std::string_view> out;
    while (!path.empty()) {
        std::size_t slash = path.find('/');
        std::string_view seg = path.substr(0, slash);
        if (!seg.empty() && seg != ".") out.push_back(seg);
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    return out;
}

void append_html_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
}

std::string_view content_type_for(const fs::path& file) {
    std::string ext = file.extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".txt") return "text/plain; charset=utf-8";
    if (ext == ".css") return "text/css";
    if (ext == ".js") return "text/javascript";
    if (ext == ".json") return "application/json";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".pdf") return "application/pdf";
    return "application/octet-stream";
}

HttpResponse error_for(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) return make_http_error(403);
    return make_http_error(404);
}

}  // namespace

ByteRange parse_byte_range(std::string_view header, std::uint64_t file_size) {
    ByteRange range;
    header = trim(header);
    if (header.empty()) return range;

    constexpr std::string_view unit = "bytes=";
    if (header.size() < unit.size() || !iequal(header.substr(0, unit.size()), unit)) {
        range.state = ByteRange::State::Invalid;
        return range;
    }
    header = trim(header.substr(unit.size()));
    std::size_t dash = header.find('-');
    if (header.empty() || header.find(',') != std::string_view::npos || dash == std::string_view::npos) {
        range.state = ByteRange::State::Invalid;
        return range;
    }
    std::string_view first = trim(header.substr(0, dash));
    std::string_view last = trim(header.substr(dash + 1));

    if (first.empty()) {
        // bytes=-N: the final N bytes
        auto suffix = parse_offset(last);
        if (!suffix || *suffix == 0) {
            range.state = ByteRange::State::Invalid;
            return range;
        }
        if (file_size == 0) {
            range.state = ByteRange::State::Unsatisfiable;
            return range;
        }
        range.length = (std::min)(*suffix, file_size);
        range.offset = file_size - range.length;
        range.state = ByteRange::State::Valid;
        return range;
    }

    auto start = parse_offset(first);
    std::optional<std::uint64_t> end;
    if (!last.empty()) end = parse_offset(last);
    if (!start || (!last.empty() && !end)) {
        range.state = ByteRange::State::Invalid;
        return range;
    }
    if (*start >= file_size || (end && *end < *start)) {
        range.state = ByteRange::State::Unsatisfiable;
        return range;
    }
    const std::uint64_t end_inclusive = end ? (std::min)(*end, file_size - 1) : file_size - 1;
    range.offset = *start;
    range.length = end_inclusive - *start + 1;
    range.state = ByteRange::State::Valid;
    return range;
}

std::string format_size(std::uintmax_t size) {
    static constexpr std::string_view units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (size < 1024) return std::to_string(size) + " B";
    double value = static_cast<double>(size);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << ' ' << units[unit];
    return out.str();
}

FileHandler::FileHandler(fs::path root, FileHandlerOptions options)
    : root_(std::move(root)), options_(std::move(options)) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) throw std::invalid_argument("file root is not a directory: " + root_.string());
}

MethodSet FileHandler::methods() const {
    MethodSet set = make_method_set({HttpMethod::Get, HttpMethod::Head});
    if (options_.allow_upload) set |= method_bit(HttpMethod::Post);
    if (options_.allow_delete) set |= method_bit(HttpMethod::Delete);
    return set;
}

HttpResponse FileHandler::operator()(const HttpRequest& request) const {
    HttpResponse resp;
    auto target = resolve(request.path);
    if (!target) {
        log_debug("files") << "path escapes the root: " << request.path;
        resp = make_http_error(403);
    } else if (request.method == HttpMethod::Get || request.method == HttpMethod::Head) {
        resp = read(request, std::move(*target));
    } else if (request.method == HttpMethod::Post && options_.allow_upload) {
        resp = upload(request, *target);
    } else if (request.method == HttpMethod::Delete && options_.allow_delete) {
        resp = remove(*target);
    } else {
        resp = make_http_error(405);
        resp.headers.add("Allow", format_allow(methods_of(methods())));
    }
    if (!resp.headers.contains("Accept-Ranges")) resp.headers.add("Accept-Ranges", "bytes");
    return resp;
}

std::optional<fs::path> FileHandler::resolve(std::string_view path) const {
    fs::path relative;
    for (std::string_view seg : path_segments(path)) {
        if (seg == ".." || seg.find('\0') != std::string_view::npos) return std::nullopt;
        relative /= fs::path(seg);
    }
    return root_ / relative;
}

HttpResponse FileHandler::read(const HttpRequest& request, fs::path target) const {
    std::error_code ec;
    fs::file_status status = fs::status(target, ec);
    if (status.type() == fs::file_type::not_found) {
        // "/page" may name page.html or page.php
        bool found = false;
        for (std::string_view suffix : {".html", ".php"}) {
            fs::path candidate = target;
            candidate += suffix;
            std::error_code candidate_ec;
            if (fs::is_regular_file(candidate, candidate_ec)) {
                target = std::move(candidate);
                found = true;
                break;
            }
        }
        if (!found) return make_http_error(404);
        return serve_file(request, target);
    }
    if (ec) return error_for(ec);

    if (fs::is_directory(status)) {
        fs::path index = target / options_.index_file;
        std::error_code index_ec;
        if (!options_.index_file.empty() && fs::is_regular_file(index, index_ec)) return serve_file(request, index);
        if (!options_.directory_listing) return make_http_error(403);
        return list_directory(request, target);
    }
    if (!fs::is_regular_file(status)) return make_http_error(403);
    return serve_file(request, target);
}

HttpResponse FileHandler::serve_file(const HttpRequest& request, const fs::path& target) const {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(target, ec);
    if (ec) return error_for(ec);
    auto file = std::make_shared<std::ifstream>(target, std::ios::binary);
    if (!file->is_open()) {
        log_debug("files") << "cannot open " << target.string();
        return make_http_error(403);
    }

    ByteRange range;
    if (std::string_view header = request.header("Range"); !header.empty()) range = parse_byte_range(header, size);
    if (range.state == ByteRange::State::Invalid || range.state == ByteRange::State::Unsatisfiable) {
        HttpResponse resp = make_http_error(416);
        resp.headers.add("Content-Range", "bytes */" + std::to_string(size));
        return resp;
    }

    HttpResponse resp;
    resp.headers.add("Content-Type", std::string(content_type_for(target)));
    std::uint64_t offset = 0;
    std::uint64_t length = size;
    if (range.state == ByteRange::State::Valid) {
        offset = range.offset;
        length = range.length;
        resp.status_code = 206;
        resp.headers.add("Content-Range", "bytes " + std::to_string(offset) + "-" + std::to_string(offset + length - 1) +
                                              "/" + std::to_string(size));
    }
    resp.headers.add("Content-Length", std::to_string(length));
    if (length == 0) return resp;

    if (offset > 0) file->seekg(static_cast<std::streamoff>(offset));
    // Streamed raw under the Content-Length above; a file that shrinks mid-send aborts the connection.
    resp.producer = [file, remaining = std::make_shared<std::uint64_t>(length)](char* buf,
                                                                                std::size_t len) -> std::size_t {
        if (*remaining == 0) return 0;
        file->read(buf, static_cast<std::streamsize>((std::min)(static_cast<std::uint64_t>(len), *remaining)));
        auto n = static_cast<std::size_t>(file->gcount());
        if (n == 0) throw std::runtime_error("file ended before its advertised length");
        *remaining -= n;
        return n;
    };
    return resp;
}

HttpResponse FileHandler::list_directory(const HttpRequest& request, const fs::path& dir) const {
    struct Entry {
        std::string name;
        bool directory{false};
        std::optional<std::uintmax_t> size;
    };

    const bool show_hidden = request.query_param("hidden") != "false";
    std::vector<Entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        Entry entry;
        entry.name = it->path().filename().string();
        if (!show_hidden && entry.name.front() == '.') continue;
        std::error_code entry_ec;
        entry.directory = it->is_directory(entry_ec);
        if (!entry.directory) {
            std::uintmax_t size = it->file_size(entry_ec);
            if (!entry_ec) entry.size = size;
        }
        entries.push_back(std::move(entry));
    }
    if (ec) return error_for(ec);
    std::ranges::sort(entries, {}, &Entry::name);

    auto segments = path_segments(request.path);
    std::string base = "/";
    std::string title = "/";
    for (std::string_view seg : segments) {
        base += percent_encode(seg);
        base += '/';
        title += seg;
        title += '/';
    }
    const std::string_view query = show_hidden ? "" : "?hidden=false";

    std::string html = "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>Index of ";
    append_html_escaped(html, title);
    html += "</title></head>\n<body><h1>Index of ";
    append_html_escaped(html, title);
    html += "</h1>\n<table>\n<tr><th>Name</th><th>Size</th></tr>\n";
    if (!segments.empty()) {
        std::string parent = base.substr(0, base.rfind('/', base.size() - 2) + 1);
        html += "<tr><td><a href=\"";
        append_html_escaped(html, parent);
        html += query;
        html += "\">..</a></td><td></td></tr>\n";
    }
    for (const Entry& entry : entries) {
        html += "<tr><td><a href=\"";
        append_html_escaped(html, base + percent_encode(entry.name) + (entry.directory ? "/" : ""));
        html += query;
        html += "\">";
        append_html_escaped(html, entry.name);
        if (entry.directory) html += '/';
        html += "</a></td><td>";
        html += entry.size ? format_size(*entry.size) : "-";
        html += "</td></tr>\n";
    }
    html += "</table>\n</body></html>\n";
    return make_http_ok(std::move(html), "text/html; charset=utf-8");
}

HttpResponse FileHandler::upload(const HttpRequest& request, const fs::path& target) const {
    int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        log_warn("files") << "cannot open " << target.string() << " for writing: " << std::strerror(err);
        return make_http_error(err == EACCES || err == EPERM ? 403 : 404);
    }
    const char* data = request.body.data();
    std::size_t left = request.body.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            log_error("files") << "write to " << target.string() << " failed: " << std::strerror(err);
            return make_http_error(500);
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
        log_error("files") << "close of " << target.string() << " failed: " << std::strerror(errno);
        return make_http_error(500);
    }
    return make_http_response(200);
}

HttpResponse FileHandler::remove(const fs::path& target) const {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(target, ec);
    if (status.type() == fs::file_type::not_found) return make_http_error(404);
    if (ec) return error_for(ec);
    if (fs::is_directory(status)) return make_http_error(403);
    if (!fs::remove(target, ec)) return ec ? error_for(ec) : make_http_error(404);
    return make_http_response(200);
}

}  // namespace ferry

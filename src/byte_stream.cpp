#include "ferry/byte_stream.hpp"
#include <algorithm>
#include <cstring>

namespace ferry {

IoResult write_all(ByteStream& stream, std::string_view data) {
    IoResult total;
    while (total.bytes < data.size()) {
        IoResult r = stream.write(data.data() + total.bytes, data.size() - total.bytes);
        if (!r.ok()) {
            r.bytes = total.bytes;
            return r;
        }
        total.bytes += r.bytes;
    }
    return total;
}

IoResult MemoryStream::read(void* buf, std::size_t len) {
    if (offset_ >= input_.size()) return {0, IoStatus::Eof, {}};
    std::size_t n = (std::min)(len, input_.size() - offset_);
    if (max_read_ > 0) n = (std::min)(n, max_read_);
    std::memcpy(buf, input_.data() + offset_, n);
    offset_ += n;
    return {n, IoStatus::Ok, {}};
}

IoResult MemoryStream::write(const void* buf, std::size_t len) {
    if (shut_down_) return {0, IoStatus::Error, std::make_error_code(std::errc::broken_pipe)};
    output_.append(static_cast<const char*>(buf), len);
    return {len, IoStatus::Ok, {}};
}

}  // namespace ferry

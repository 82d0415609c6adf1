#include <socks5chain/utils/buffer.hpp>
#include <algorithm>

namespace socks5chain::utils {

Buffer& Buffer::HasWritten(size_t len) noexcept {
  assert(len <= WritableBytes());
  write_pos_ += len;
  return *this;
}

Buffer& Buffer::Seek(size_t len) noexcept {
  assert(len <= ReadableBytes());
  read_pos_ += len;
  return *this;
}

Buffer& Buffer::SeekToBegin() noexcept {
  read_pos_ = 0;
  return *this;
}

void Buffer::Peek(void* out, size_t len) const noexcept {
  assert(len <= ReadableBytes());
  if (len != 0) {
    std::memcpy(out, BeginRead(), len);
  }
}

void Buffer::Read(void* out, size_t len) noexcept {
  Peek(out, len);
  Seek(len);
}

void Buffer::Append(const void* data, size_t len) noexcept {
  assert(len <= WritableBytes());
  if (len != 0) {
    std::memcpy(BeginWrite(), data, len);
  }
  HasWritten(len);
}

bool operator==(const Buffer& lhs, const Buffer& rhs) noexcept {
  return std::ranges::equal(lhs.Readable(), rhs.Readable());
}

}  // namespace socks5chain::utils

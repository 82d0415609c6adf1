#pragma once

#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <span>
#include <type_traits>

namespace socks5chain::utils {

template <typename T>
concept TriviallyCopyable = std::is_trivially_copyable_v<T>;

/**
 * @brief Byte cursor over memory it does not own. Bytes are appended at the
 * write position and consumed from the read position; the read position
 * never passes the write position.
 */
class Buffer {
 public:
  Buffer(char* data, size_t size) noexcept : storage_{data, size} {}

  std::span<char> Readable() noexcept {
    return storage_.subspan(read_pos_, ReadableBytes());
  }
  std::span<const char> Readable() const noexcept {
    return storage_.subspan(read_pos_, ReadableBytes());
  }
  std::span<char> Writable() noexcept { return storage_.subspan(write_pos_); }

  char* BeginRead() noexcept { return Readable().data(); }
  const char* BeginRead() const noexcept { return Readable().data(); }
  char* BeginWrite() noexcept { return Writable().data(); }

  size_t ReadableBytes() const noexcept { return write_pos_ - read_pos_; }
  size_t WritableBytes() const noexcept {
    return storage_.size() - write_pos_;
  }
  size_t Size() const noexcept { return storage_.size(); }

  void Clear() noexcept { read_pos_ = write_pos_ = 0; }

  // Mark len bytes past the write position as filled by an external writer.
  Buffer& HasWritten(size_t len) noexcept;
  Buffer& Seek(size_t len) noexcept;
  Buffer& SeekToBegin() noexcept;

  void Peek(void* out, size_t len) const noexcept;

  template <TriviallyCopyable T>
  T Read() noexcept {
    T out;
    Read(&out, sizeof(out));
    return out;
  }

  template <TriviallyCopyable T>
  void Read(T& out) noexcept {
    Read(&out, sizeof(out));
  }

  template <typename T, size_t N>
  void Read(std::array<T, N>& out, size_t len = N) noexcept {
    assert(len <= N);
    Read(out.data(), len);
  }

  // Value of the last sizeof(T) bytes written. Reading resumes after them.
  template <TriviallyCopyable T>
  T ReadFromEnd() noexcept {
    assert(write_pos_ >= sizeof(T));
    read_pos_ = write_pos_ - sizeof(T);
    return Read<T>();
  }

  void Append(const void* data, size_t len) noexcept;

  template <TriviallyCopyable T>
  void Append(const T& value) noexcept {
    Append(&value, sizeof(value));
  }

  template <typename T, size_t N>
  void Append(const std::array<T, N>& data, size_t len = N) noexcept {
    assert(len <= N);
    Append(data.data(), len);
  }

 protected:
  void Rebind(char* data) noexcept { storage_ = {data, storage_.size()}; }

 private:
  void Read(void* out, size_t len) noexcept;

  std::span<char> storage_;
  size_t read_pos_{};
  size_t write_pos_{};
};

// Buffers are equal when their unread bytes are.
bool operator==(const Buffer& lhs, const Buffer& rhs) noexcept;

namespace detail {

template <size_t N>
struct StaticStorage {
  std::array<char, N> bytes;
};

}  // namespace detail

/**
 * @brief Buffer over an array it owns. Copies get their own array.
 */
template <size_t BufSize>
class StaticBuffer final : private detail::StaticStorage<BufSize>,
                           public Buffer {
 public:
  StaticBuffer() noexcept : Buffer{this->bytes.data(), BufSize} {}

  StaticBuffer(const StaticBuffer& other) noexcept
      : detail::StaticStorage<BufSize>(other), Buffer(other) {
    Rebind(this->bytes.data());
  }

  StaticBuffer& operator=(const StaticBuffer& other) noexcept {
    detail::StaticStorage<BufSize>::operator=(other);
    Buffer::operator=(other);
    Rebind(this->bytes.data());
    return *this;
  }
};

}  // namespace socks5chain::utils

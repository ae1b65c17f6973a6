#pragma once

#include <cstddef>
#include <string_view>

namespace restspy {

/**
 * A simple growable char buffer handing out raw pointers to its free capacity.
 * It is designed for decompression libraries (zlib, brotli, zstd) which write directly into
 * the buffer and report the number of produced bytes, do not use it for general-purpose data storage.
 */
class RawChars {
 public:
  using value_type = char;
  using size_type = std::size_t;

  RawChars() noexcept = default;

  explicit RawChars(size_type capacity);

  explicit RawChars(std::string_view data);

  RawChars(const RawChars& rhs);
  RawChars(RawChars&& rhs) noexcept;

  RawChars& operator=(const RawChars& rhs);
  RawChars& operator=(RawChars&& rhs) noexcept;

  ~RawChars();

  void append(std::string_view data);

  void clear() noexcept { _size = 0; }

  void setSize(size_type newSize);

  void addSize(size_type delta);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  // Growth is exponential.
  void ensureAvailableCapacityExponential(size_type availableCapacity);

  [[nodiscard]] char* data() noexcept { return _buf; }
  [[nodiscard]] const char* data() const noexcept { return _buf; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  void swap(RawChars& rhs) noexcept;

  operator std::string_view() const noexcept { return {_buf, _size}; }

  bool operator==(const RawChars& rhs) const noexcept { return std::string_view(*this) == std::string_view(rhs); }

 private:
  void reallocUp(size_type newCapacity);

  char* _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawChars& lhs, RawChars& rhs) noexcept { lhs.swap(rhs); }

}  // namespace restspy

#pragma once
#include "clonekit/error.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace clonekit {

// Cursor over a borrowed byte buffer. Every decoder owns one and advances it
// only through these calls; running past the end throws Error{underflow_kind}.
class ByteReader {
public:
  explicit ByteReader(std::span<const std::uint8_t> data,
                      ErrorKind underflow_kind = ErrorKind::ProtocolError)
    : data_(data), underflow_kind_(underflow_kind) {}

  [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }
  [[nodiscard]] auto remaining() const noexcept -> std::size_t { return data_.size() - pos_; }
  [[nodiscard]] auto at_end() const noexcept -> bool { return pos_ == data_.size(); }

  // Bytes already consumed, i.e. data[0, position()).
  [[nodiscard]] auto consumed_bytes() const -> std::span<const std::uint8_t> {
    return data_.first(pos_);
  }
  // Bytes not yet consumed, without advancing.
  [[nodiscard]] auto rest() const -> std::span<const std::uint8_t> { return data_.subspan(pos_); }

  auto read_byte() -> std::uint8_t;
  auto read_bytes(std::size_t n) -> std::span<const std::uint8_t>;
  auto read_be32() -> std::uint32_t;

  // Inflate the zlib stream at the cursor and advance past exactly the
  // compressed bytes zlib read.
  auto inflate(std::size_t size_hint = 0) -> std::vector<std::uint8_t>;
  [[nodiscard]] auto bytes_consumed_by_last_inflate() const noexcept -> std::size_t {
    return last_inflate_;
  }

private:
  void require(std::size_t n) const;

  std::span<const std::uint8_t> data_;
  std::size_t pos_ = 0;
  std::size_t last_inflate_ = 0;
  ErrorKind underflow_kind_;
};

} // namespace clonekit

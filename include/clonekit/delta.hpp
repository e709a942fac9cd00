#pragma once
#include <cstdint>
#include <span>
#include <vector>

namespace clonekit::delta {

/**
 * Rebuild a target object from `base` and a git delta instruction stream:
 *   <source length varint> <target length varint> (copy | insert)*
 *
 * copy:   1xxxxxxx, then one byte per set bit: bits 0-3 pick the
 *         little-endian offset bytes, bits 4-6 the size bytes.
 *         A size of zero means 0x10000.
 * insert: 0nnnnnnn, then n literal bytes (n > 0).
 *
 * Throws Error{CorruptDelta} if the source length is not base.size(),
 * a copy reaches outside the base, the stream is truncated, or the
 * output length differs from the declared target length.
 */
std::vector<std::uint8_t> apply(std::span<const std::uint8_t> base,
                                std::span<const std::uint8_t> delta);

} // namespace clonekit::delta

#pragma once

#include <crock/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace crock {

using Bytes16 = std::array<uint8_t, 16>;

namespace base32 {

// Crockford Base32 over a fixed 128-bit payload.
//
// Encoding packs the bytes MSB first into 5-bit groups; the 26th symbol
// holds the last 3 bits followed by 2 zero bits. Output is uppercase with
// no padding and no hyphens.
//
// Decoding ignores '-', is case-insensitive, and folds I/L to 1 and O to 0.
// 'U' is not accepted.

constexpr size_t kPayloadBytes = 16;
constexpr size_t kEncodedLength = 26;
extern const char kAlphabet[33];

std::string encode(const Bytes16& bytes);

// Byte-buffer entry point; fails with WrongByteCount unless len == 16.
Result<std::string> encode(const uint8_t* data, size_t len);

// Errors: Decode for a symbol outside the alphabet or non-zero padding bits,
// InvalidLength when the symbols do not make up exactly 16 bytes.
Result<Bytes16> decode(std::string_view text);

bool is_valid(std::string_view text);

// Insert a hyphen every `group` symbols (0 leaves the text unchanged).
// The result still decodes to the same bytes.
std::string format_grouped(std::string_view canonical, size_t group);

} // namespace base32
} // namespace crock

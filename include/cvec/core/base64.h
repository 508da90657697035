#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace cvec::core {

// base64_encode returns the RFC 4648 standard-alphabet encoding of bytes,
// including '=' padding.
// No external dependencies — pure C++20.
[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> bytes);

// strip_base64_padding removes trailing '=' characters, stopping at the first
// character from the end that is not '='.
[[nodiscard]] std::string strip_base64_padding(std::string encoded);

}  // namespace cvec::core

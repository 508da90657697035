#include "cvec/core/base64.h"

#include <array>

namespace cvec::core {

namespace {

// RFC 4648 §4 — standard base64 alphabet.
constexpr std::array<char, 64> kAlphabet = {
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
    'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
    'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
    'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/',
};

constexpr char kPad = '=';

}  // namespace

std::string base64_encode(const std::span<const std::uint8_t> bytes) {
  std::string out;
  out.reserve(((bytes.size() + 2u) / 3u) * 4u);

  std::size_t i = 0;
  // Full 24-bit groups.
  for (; i + 3u <= bytes.size(); i += 3u) {
    const std::uint32_t group = (static_cast<std::uint32_t>(bytes[i]) << 16u) |
                                (static_cast<std::uint32_t>(bytes[i + 1u]) << 8u) |
                                static_cast<std::uint32_t>(bytes[i + 2u]);
    out.push_back(kAlphabet[(group >> 18u) & 0x3Fu]);
    out.push_back(kAlphabet[(group >> 12u) & 0x3Fu]);
    out.push_back(kAlphabet[(group >> 6u) & 0x3Fu]);
    out.push_back(kAlphabet[group & 0x3Fu]);
  }

  // RFC 4648 §4 — final quantum of 8 or 16 bits is padded to 4 characters.
  const std::size_t remaining = bytes.size() - i;
  if (remaining == 1u) {
    const std::uint32_t group = static_cast<std::uint32_t>(bytes[i]) << 16u;
    out.push_back(kAlphabet[(group >> 18u) & 0x3Fu]);
    out.push_back(kAlphabet[(group >> 12u) & 0x3Fu]);
    out.push_back(kPad);
    out.push_back(kPad);
  } else if (remaining == 2u) {
    const std::uint32_t group = (static_cast<std::uint32_t>(bytes[i]) << 16u) |
                                (static_cast<std::uint32_t>(bytes[i + 1u]) << 8u);
    out.push_back(kAlphabet[(group >> 18u) & 0x3Fu]);
    out.push_back(kAlphabet[(group >> 12u) & 0x3Fu]);
    out.push_back(kAlphabet[(group >> 6u) & 0x3Fu]);
    out.push_back(kPad);
  }

  return out;
}

std::string strip_base64_padding(std::string encoded) {
  while (!encoded.empty() && encoded.back() == kPad) {
    encoded.pop_back();
  }
  encoded.shrink_to_fit();
  return encoded;
}

}  // namespace cvec::core

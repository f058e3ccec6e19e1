#include "project/hex.hpp"
#include "project/project_error.hpp"

namespace vbaunlock::project {

namespace {

int digit_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

} // namespace

std::string to_hex(const std::vector<uint8_t>& bytes) {
  static constexpr char DIGITS[] = "0123456789ABCDEF";

  std::string text;
  text.reserve(bytes.size() * 2);
  for (uint8_t byte : bytes) {
    text.push_back(DIGITS[byte >> 4]);
    text.push_back(DIGITS[byte & 0x0F]);
  }
  return text;
}

std::vector<uint8_t> from_hex(const std::string& text) {
  if (text.size() % 2 != 0) {
    throw MalformedRecordError("hex value of odd length " + std::to_string(text.size()));
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    const int high = digit_value(text[i]);
    const int low = digit_value(text[i + 1]);
    if (high < 0 || low < 0) {
      throw MalformedRecordError("invalid hex digit at position " + std::to_string(high < 0 ? i : i + 1));
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return bytes;
}

} // namespace vbaunlock::project

/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 */

#include "utils/string_utils.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>

namespace hkpdb {
namespace utils {

namespace {

constexpr const char* kHexDigits = "0123456789abcdef";

/**
 * @brief Word characters are letters and numbers (general categories L and N)
 */
bool IsWordCodepoint(UChar32 codepoint) {
  return (U_GET_GC_MASK(codepoint) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

void AppendCodepoint(std::string& out, UChar32 codepoint) {
  uint8_t buffer[U8_MAX_LENGTH];
  int32_t length = 0;
  U8_APPEND_UNSAFE(buffer, length, codepoint);
  out.append(reinterpret_cast<const char*>(buffer),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
             static_cast<size_t>(length));
}

}  // namespace

std::string ToLowerAscii(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(), [](char chr) {
    return (chr >= 'A' && chr <= 'Z') ? static_cast<char>(chr - 'A' + 'a') : chr;
  });
  return result;
}

void LowercaseAll(std::vector<std::string>& values) {
  for (auto& value : values) {
    value = ToLowerAscii(value);
  }
}

std::string ToLowerUnicode(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto length = static_cast<int32_t>(text.size());
  int32_t offset = 0;

  while (offset < length) {
    const int32_t start = offset;
    UChar32 codepoint = 0;
    U8_NEXT(bytes, offset, length, codepoint);
    if (codepoint < 0) {
      result.append(text.substr(static_cast<size_t>(start), static_cast<size_t>(offset - start)));
      continue;
    }
    AppendCodepoint(result, u_tolower(codepoint));
  }
  return result;
}

std::vector<std::string> SplitWords(std::string_view text) {
  std::vector<std::string> words;
  std::string current;

  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto length = static_cast<int32_t>(text.size());
  int32_t offset = 0;

  while (offset < length) {
    UChar32 codepoint = 0;
    U8_NEXT(bytes, offset, length, codepoint);

    // Negative codepoint: ill-formed sequence, acts as a separator
    if (codepoint >= 0 && IsWordCodepoint(codepoint)) {
      AppendCodepoint(current, u_tolower(codepoint));
      continue;
    }
    if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }

  return words;
}

std::string HexEncode(const uint8_t* data, size_t size) {
  std::string result;
  result.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    result += kHexDigits[data[i] >> 4];    // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    result += kHexDigits[data[i] & 0x0F];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return result;
}

std::string HexEncode(std::string_view bytes) {
  return HexEncode(reinterpret_cast<const uint8_t*>(bytes.data()),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
                   bytes.size());
}

std::string Reverse(std::string_view text) {
  return {text.rbegin(), text.rend()};
}

}  // namespace utils
}  // namespace hkpdb

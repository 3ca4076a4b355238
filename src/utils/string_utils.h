/**
 * @file string_utils.h
 * @brief String helpers for identifiers and keyword extraction
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hkpdb {
namespace utils {

/**
 * @brief Lowercase ASCII letters, leave every other byte untouched
 *
 * Used for hex identifiers (fingerprints, key IDs, digests).
 */
std::string ToLowerAscii(std::string_view text);

/**
 * @brief Lowercase every element in place (ASCII)
 */
void LowercaseAll(std::vector<std::string>& values);

/**
 * @brief Lowercase every code point (simple case mapping)
 *
 * Ill-formed UTF-8 sequences are copied through unchanged.
 */
std::string ToLowerUnicode(std::string_view text);

/**
 * @brief Split text into lowercase word tokens
 *
 * A token is a maximal run of Unicode letters (L*) or numbers (N*). Any other
 * code point, and any ill-formed UTF-8 sequence, separates tokens. Tokens are
 * lowercased with simple case mapping. Duplicates are kept; order follows the
 * input.
 *
 * @param text UTF-8 text (may contain invalid sequences)
 * @return Tokens in input order
 */
std::vector<std::string> SplitWords(std::string_view text);

/**
 * @brief Encode bytes as lowercase hex
 */
std::string HexEncode(const uint8_t* data, size_t size);

/**
 * @brief Encode a byte string as lowercase hex
 */
std::string HexEncode(std::string_view bytes);

/**
 * @brief Return the characters of text in reverse order
 */
std::string Reverse(std::string_view text);

}  // namespace utils
}  // namespace hkpdb

#ifndef __HDC_TEXT_UTILS__
#define __HDC_TEXT_UTILS__

#include "HdcException.hpp"
#include "Headers.hpp"

namespace hdc {
/**
 * @brief Returns true when @p bytes is well-formed UTF-8 (no overlongs,
 * surrogates or code points above U+10FFFF).
 */
bool isValidUtf8(const string& bytes);

/**
 * @brief Returns @p bytes unchanged when it is valid UTF-8.
 * @throws HdcException (TEXT_DECODE) otherwise.
 */
string decodeUtf8(const string& bytes);

/**
 * @brief Decodes @p bytes, replacing every invalid sequence with U+FFFD.
 */
string decodeUtf8Lossy(const string& bytes);
}  // namespace hdc

#endif  // __HDC_TEXT_UTILS__

#pragma once

#include <dumpnav/core/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dumpnav::parser {

/// Break one tuple (`(1, 'a,b', NULL, NOW())`) into raw tokens.
///
/// One layer of outer parentheses is removed. Tokens are, in priority order: a
/// quoted string (kept with its quotes), the NULL keyword, or any run up to the
/// next top-level comma. Surrounding whitespace is dropped, as are empty tokens.
[[nodiscard]] auto tokenize_tuple(std::string_view tuple_text) -> std::vector<std::string>;

/// Decode the body of a quoted token: `\'` and `''` become `'`, `\\` becomes `\`.
/// Any other escape sequence is kept verbatim.
[[nodiscard]] auto unescape_string(std::string_view quoted_body) -> std::string;

/// Convert one raw token to a Value. Never fails: anything that is not NULL, a
/// quoted string or a well-formed number is returned as Text.
[[nodiscard]] auto coerce_token(std::string_view token) -> Value;

/// tokenize_tuple followed by coerce_token on every token.
[[nodiscard]] auto parse_tuple(std::string_view tuple_text) -> Row;

}  // namespace dumpnav::parser

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dumpnav::parser {

/// Split a VALUES body into its top-level tuples, each still wrapped in its
/// parentheses: `(1,'x,y'),(2,'(z)')` -> `(1,'x,y')`, `(2,'(z)')`.
///
/// Commas inside quoted strings or nested parens do not split. Malformed input
/// (unterminated string, unbalanced parens) never fails: whatever has been
/// accumulated when the input ends is flushed as the last tuple.
[[nodiscard]] auto split_tuples(std::string_view values_body) -> std::vector<std::string>;

}  // namespace dumpnav::parser

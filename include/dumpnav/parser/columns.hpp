#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dumpnav::parser {

/// Split a CREATE TABLE body on commas at paren depth 0. Commas inside a
/// parenthesised sub-expression (ENUM lists, DECIMAL(10,2)) or inside a quoted
/// string (COMMENT 'a, b') do not split. Fragments are returned untrimmed.
[[nodiscard]] auto split_top_level(std::string_view body) -> std::vector<std::string_view>;

/// True when the fragment declares an index or constraint rather than a column.
[[nodiscard]] auto is_index_definition(std::string_view fragment) noexcept -> bool;

/// Leading column identifier of a definition fragment, back-quoted or bare.
[[nodiscard]] auto leading_identifier(std::string_view fragment) -> std::optional<std::string>;

/// Ordered column names declared by a CREATE TABLE body.
[[nodiscard]] auto parse_column_definitions(std::string_view body) -> std::vector<std::string>;

}  // namespace dumpnav::parser

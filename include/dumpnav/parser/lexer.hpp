#pragma once

#include <cstddef>
#include <string_view>

namespace dumpnav::parser {

/// Identifier characters: ASCII alphanumerics, '_' and any byte of a
/// multi-byte UTF-8 sequence.
[[nodiscard]] constexpr auto is_ident_char(char ch) noexcept -> bool {
    const auto uch = static_cast<unsigned char>(ch);
    return (uch >= 'a' && uch <= 'z') || (uch >= 'A' && uch <= 'Z') ||
           (uch >= '0' && uch <= '9') || uch == '_' || uch >= 0x80;
}

[[nodiscard]] constexpr auto is_space(char ch) noexcept -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

[[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view;

/// Index of the first non-whitespace character at or after `pos` (text.size() if none).
[[nodiscard]] auto skip_space(std::string_view text, std::size_t pos) noexcept -> std::size_t;

/// Case-insensitive (ASCII) comparison of `keyword` against text at `pos`.
[[nodiscard]] auto matches_at(std::string_view text, std::size_t pos,
                              std::string_view keyword) noexcept -> bool;

/// Case-insensitive search for `keyword` starting at `from`; npos when absent.
[[nodiscard]] auto find_keyword(std::string_view text, std::string_view keyword,
                                std::size_t from = 0) noexcept -> std::size_t;

/// True when `text` starts with `phrase` (case-insensitive) and the phrase is not
/// immediately followed by an identifier character. Single spaces inside `phrase`
/// match any non-empty whitespace run.
[[nodiscard]] auto starts_with_phrase(std::string_view text, std::string_view phrase) noexcept
    -> bool;

/// Quote/escape state shared by every scanner that must ignore punctuation inside
/// single-quoted SQL strings.
///
/// An unescaped quote toggles `in_string`. Inside a string a backslash toggles
/// `escape_pending`; any other character clears it.
struct QuoteState {
    bool in_string = false;
    bool escape_pending = false;

    void feed(char ch) noexcept {
        if (ch == '\'' && !escape_pending) {
            in_string = !in_string;
        }
        if (ch == '\\' && in_string) {
            escape_pending = !escape_pending;
        } else {
            escape_pending = false;
        }
    }
};

}  // namespace dumpnav::parser

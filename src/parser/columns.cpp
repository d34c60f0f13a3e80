#include <dumpnav/parser/columns.hpp>
#include <dumpnav/parser/lexer.hpp>

#include <array>

namespace dumpnav::parser {

namespace {

// Longer phrases first so `UNIQUE KEY` is not mistaken for a column named UNIQUE.
constexpr std::array<std::string_view, 11> kIndexKeywords = {
    "PRIMARY KEY", "UNIQUE KEY", "UNIQUE INDEX", "FOREIGN KEY", "CONSTRAINT", "FULLTEXT",
    "SPATIAL",     "UNIQUE",     "INDEX",        "CHECK",       "KEY",
};

}  // namespace

auto split_top_level(std::string_view body) -> std::vector<std::string_view> {
    std::vector<std::string_view> fragments;
    QuoteState quotes;
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char ch = body[i];
        quotes.feed(ch);
        if (quotes.in_string) {
            continue;
        }
        if (ch == '(') {
            ++depth;
        } else if (ch == ')') {
            if (depth > 0) {
                --depth;
            }
        } else if (ch == ',' && depth == 0) {
            fragments.push_back(body.substr(start, i - start));
            start = i + 1;
        }
    }
    fragments.push_back(body.substr(start));
    return fragments;
}

auto is_index_definition(std::string_view fragment) noexcept -> bool {
    const std::string_view text = trim(fragment);
    for (const auto keyword : kIndexKeywords) {
        if (starts_with_phrase(text, keyword)) {
            return true;
        }
    }
    return false;
}

auto leading_identifier(std::string_view fragment) -> std::optional<std::string> {
    const std::string_view text = trim(fragment);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '`') {
        // `` inside a quoted identifier is a literal backtick.
        std::string name;
        std::size_t i = 1;
        while (i < text.size()) {
            if (text[i] == '`') {
                if (i + 1 < text.size() && text[i + 1] == '`') {
                    name.push_back('`');
                    i += 2;
                    continue;
                }
                break;
            }
            name.push_back(text[i]);
            ++i;
        }
        if (i >= text.size() || name.empty()) {
            return std::nullopt;
        }
        return name;
    }
    std::size_t end = 0;
    while (end < text.size() && is_ident_char(text[end])) {
        ++end;
    }
    if (end == 0) {
        return std::nullopt;
    }
    return std::string(text.substr(0, end));
}

auto parse_column_definitions(std::string_view body) -> std::vector<std::string> {
    std::vector<std::string> columns;
    for (const auto fragment : split_top_level(body)) {
        if (is_index_definition(fragment)) {
            continue;
        }
        if (auto name = leading_identifier(fragment)) {
            columns.push_back(std::move(*name));
        }
    }
    return columns;
}

}  // namespace dumpnav::parser

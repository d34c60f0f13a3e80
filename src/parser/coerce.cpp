#include <dumpnav/parser/coerce.hpp>
#include <dumpnav/parser/lexer.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>

namespace dumpnav::parser {

namespace {

/// End of the quoted token opening at `pos` (index of the closing quote).
auto find_closing_quote(std::string_view text, std::size_t pos) -> std::optional<std::size_t> {
    std::size_t i = pos + 1;
    while (i < text.size()) {
        const char ch = text[i];
        if (ch == '\\') {
            i += 2;
            continue;
        }
        if (ch == '\'') {
            if (i + 1 < text.size() && text[i + 1] == '\'') {
                i += 2;
                continue;
            }
            return i;
        }
        ++i;
    }
    return std::nullopt;
}

/// End of an unquoted token: the next comma outside parens and strings.
auto find_token_end(std::string_view text, std::size_t pos, bool track_quotes) -> std::size_t {
    QuoteState quotes;
    int depth = 0;
    for (std::size_t i = pos; i < text.size(); ++i) {
        const char ch = text[i];
        if (track_quotes) {
            quotes.feed(ch);
            if (quotes.in_string) {
                continue;
            }
        }
        if (ch == '(') {
            ++depth;
        } else if (ch == ')') {
            if (depth > 0) {
                --depth;
            }
        } else if (ch == ',' && depth == 0) {
            return i;
        }
    }
    return text.size();
}

auto is_null_keyword(std::string_view text, std::size_t pos) -> bool {
    constexpr std::string_view keyword = "NULL";
    if (!matches_at(text, pos, keyword)) {
        return false;
    }
    const std::size_t after = pos + keyword.size();
    return after >= text.size() || !is_ident_char(text[after]);
}

auto is_digit(char ch) -> bool { return ch >= '0' && ch <= '9'; }

/// Length of the run of digits starting at `pos`.
auto digit_run(std::string_view text, std::size_t pos) -> std::size_t {
    std::size_t end = pos;
    while (end < text.size() && is_digit(text[end])) {
        ++end;
    }
    return end - pos;
}

/// -?[0-9]+
auto is_integer_literal(std::string_view text) -> bool {
    const std::size_t sign = (!text.empty() && text.front() == '-') ? 1 : 0;
    const std::size_t digits = digit_run(text, sign);
    return digits > 0 && sign + digits == text.size();
}

/// -?[0-9]+\.[0-9]*
auto is_decimal_literal(std::string_view text) -> bool {
    const std::size_t sign = (!text.empty() && text.front() == '-') ? 1 : 0;
    const std::size_t digits = digit_run(text, sign);
    const std::size_t dot = sign + digits;
    if (digits == 0 || dot >= text.size() || text[dot] != '.') {
        return false;
    }
    return dot + 1 + digit_run(text, dot + 1) == text.size();
}

auto try_parse_int(std::string_view text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

}  // namespace

auto tokenize_tuple(std::string_view tuple_text) -> std::vector<std::string> {
    std::string_view text = trim(tuple_text);
    if (!text.empty() && text.front() == '(') {
        text.remove_prefix(1);
    }
    if (!text.empty() && text.back() == ')') {
        text.remove_suffix(1);
    }

    std::vector<std::string> tokens;
    std::size_t pos = 0;
    while (true) {
        pos = skip_space(text, pos);
        if (pos >= text.size()) {
            break;
        }
        if (text[pos] == ',') {
            ++pos;
            continue;
        }
        if (text[pos] == '\'') {
            if (auto close = find_closing_quote(text, pos)) {
                tokens.emplace_back(text.substr(pos, *close + 1 - pos));
                pos = *close + 1;
                continue;
            }
        }
        if (is_null_keyword(text, pos)) {
            tokens.emplace_back(text.substr(pos, 4));
            pos += 4;
            continue;
        }
        const std::size_t end = find_token_end(text, pos, text[pos] != '\'');
        const std::string_view token = trim(text.substr(pos, end - pos));
        if (!token.empty()) {
            tokens.emplace_back(token);
        }
        pos = end;
    }
    return tokens;
}

auto unescape_string(std::string_view quoted_body) -> std::string {
    std::string out;
    out.reserve(quoted_body.size());
    for (std::size_t i = 0; i < quoted_body.size(); ++i) {
        const char ch = quoted_body[i];
        const char next = i + 1 < quoted_body.size() ? quoted_body[i + 1] : '\0';
        if ((ch == '\\' && (next == '\'' || next == '\\')) || (ch == '\'' && next == '\'')) {
            out.push_back(next);
            ++i;
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

auto coerce_token(std::string_view token) -> Value {
    const std::string_view text = trim(token);
    if (text.size() == 4 && matches_at(text, 0, "NULL")) {
        return Null{};
    }
    if (text.size() >= 2 && text.front() == '\'' && text.back() == '\'') {
        return unescape_string(text.substr(1, text.size() - 2));
    }
    if (is_integer_literal(text)) {
        std::int64_t value = 0;
        if (try_parse_int(text, value)) {
            return value;
        }
        return std::string(text);
    }
    if (is_decimal_literal(text)) {
        double value = 0.0;
        if (try_parse_double(std::string(text), value)) {
            return value;
        }
        return std::string(text);
    }
    return std::string(text);
}

auto parse_tuple(std::string_view tuple_text) -> Row {
    Row row;
    auto tokens = tokenize_tuple(tuple_text);
    row.reserve(tokens.size());
    for (const auto& token : tokens) {
        row.push_back(coerce_token(token));
    }
    return row;
}

}  // namespace dumpnav::parser

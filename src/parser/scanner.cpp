#include <dumpnav/parser/lexer.hpp>
#include <dumpnav/parser/scanner.hpp>

namespace dumpnav::parser {

namespace {

constexpr std::string_view kEngineMarker = "ENGINE";

/// Two keywords separated by at least one whitespace character, not preceded by
/// an identifier character.
auto find_keyword_pair(std::string_view text, std::string_view first, std::string_view second,
                       std::size_t from) -> std::size_t {
    std::size_t pos = from;
    while (true) {
        pos = find_keyword(text, first, pos);
        if (pos == std::string_view::npos) {
            return pos;
        }
        const bool left_boundary = pos == 0 || !is_ident_char(text[pos - 1]);
        const std::size_t gap = pos + first.size();
        const std::size_t next = skip_space(text, gap);
        if (left_boundary && next > gap && matches_at(text, next, second)) {
            return pos;
        }
        ++pos;
    }
}

/// Parse an optionally back-quoted identifier at `pos`. On success `pos` is left
/// just past the identifier (and its closing quote).
auto read_identifier(std::string_view text, std::size_t& pos) -> std::optional<std::string> {
    if (pos < text.size() && text[pos] == '`') {
        const std::size_t close = text.find('`', pos + 1);
        if (close == std::string_view::npos || close == pos + 1) {
            return std::nullopt;
        }
        std::string_view name = text.substr(pos + 1, close - pos - 1);
        if (name.find('\n') != std::string_view::npos) {
            return std::nullopt;
        }
        pos = close + 1;
        return std::string(name);
    }
    const std::size_t start = pos;
    while (pos < text.size() && is_ident_char(text[pos])) {
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }
    return std::string(text.substr(start, pos - start));
}

/// Require one or more whitespace characters at `pos`.
auto require_space(std::string_view text, std::size_t& pos) -> bool {
    const std::size_t next = skip_space(text, pos);
    if (next == pos) {
        return false;
    }
    pos = next;
    return true;
}

/// True when `ENGINE` (optionally followed by whitespace) and `=` start at `pos`.
auto engine_marker_at(std::string_view text, std::size_t pos) -> bool {
    if (!matches_at(text, pos, kEngineMarker)) {
        return false;
    }
    const std::size_t eq = skip_space(text, pos + kEngineMarker.size());
    return eq < text.size() && text[eq] == '=';
}

/// First `;` at or after `from` outside a single-quoted string.
auto find_terminator(std::string_view text, std::size_t from) -> std::size_t {
    QuoteState quotes;
    for (std::size_t i = from; i < text.size(); ++i) {
        if (text[i] == ';' && !quotes.in_string) {
            return i;
        }
        quotes.feed(text[i]);
    }
    return std::string_view::npos;
}

}  // namespace

auto SchemaScanner::next() -> std::optional<SchemaStatement> {
    while (pos_ < text_.size()) {
        const std::size_t start = find_keyword_pair(text_, "CREATE", "TABLE", pos_);
        if (start == std::string_view::npos) {
            pos_ = text_.size();
            break;
        }
        pos_ = start + 1;
        if (auto statement = match_at(start)) {
            return statement;
        }
    }
    return std::nullopt;
}

auto SchemaScanner::match_at(std::size_t start) const -> std::optional<SchemaStatement> {
    std::size_t pos = start + std::string_view("CREATE").size();
    if (!require_space(text_, pos) || !matches_at(text_, pos, "TABLE")) {
        return std::nullopt;
    }
    pos += std::string_view("TABLE").size();
    if (!require_space(text_, pos)) {
        return std::nullopt;
    }
    auto name = read_identifier(text_, pos);
    if (!name.has_value()) {
        return std::nullopt;
    }
    pos = skip_space(text_, pos);
    if (pos >= text_.size() || text_[pos] != '(') {
        return std::nullopt;
    }
    const std::size_t body_start = pos + 1;

    // The marker must belong to this statement, not to a later CREATE TABLE.
    std::size_t limit = find_keyword_pair(text_, "CREATE", "TABLE", body_start);
    if (limit == std::string_view::npos) {
        limit = text_.size();
    }
    for (std::size_t close = body_start; close < limit; ++close) {
        if (text_[close] != ')') {
            continue;
        }
        if (engine_marker_at(text_, skip_space(text_, close + 1))) {
            return SchemaStatement{
                .name = std::move(*name),
                .body = std::string(text_.substr(body_start, close - body_start)),
                .offset = start,
            };
        }
    }
    return std::nullopt;
}

auto InsertScanner::next() -> std::optional<InsertStatement> {
    while (pos_ < text_.size()) {
        const std::size_t start = find_keyword_pair(text_, "INSERT", "INTO", pos_);
        if (start == std::string_view::npos) {
            pos_ = text_.size();
            break;
        }
        auto match = match_at(start);
        if (!match.has_value()) {
            pos_ = start + 1;
            continue;
        }
        pos_ = match->second;
        return std::move(match->first);
    }
    return std::nullopt;
}

auto InsertScanner::match_at(std::size_t start) const
    -> std::optional<std::pair<InsertStatement, std::size_t>> {
    std::size_t pos = start + std::string_view("INSERT").size();
    if (!require_space(text_, pos) || !matches_at(text_, pos, "INTO")) {
        return std::nullopt;
    }
    pos += std::string_view("INTO").size();
    if (!require_space(text_, pos)) {
        return std::nullopt;
    }
    auto name = read_identifier(text_, pos);
    if (!name.has_value()) {
        return std::nullopt;
    }

    std::optional<std::vector<std::string>> columns;
    pos = skip_space(text_, pos);
    if (pos < text_.size() && text_[pos] == '(') {
        const std::size_t close = text_.find(')', pos + 1);
        if (close == std::string_view::npos || close == pos + 1) {
            return std::nullopt;
        }
        columns = parse_column_list(text_.substr(pos + 1, close - pos - 1));
        pos = skip_space(text_, close + 1);
    }

    if (!matches_at(text_, pos, "VALUES")) {
        return std::nullopt;
    }
    pos += std::string_view("VALUES").size();
    if (pos < text_.size() && is_ident_char(text_[pos])) {
        return std::nullopt;
    }
    pos = skip_space(text_, pos);

    const std::size_t terminator = find_terminator(text_, pos);
    if (terminator == std::string_view::npos || terminator == pos) {
        return std::nullopt;
    }
    InsertStatement statement{
        .name = std::move(*name),
        .explicit_columns = std::move(columns),
        .values_body = std::string(text_.substr(pos, terminator - pos)),
        .offset = start,
    };
    return std::make_pair(std::move(statement), terminator + 1);
}

auto scan_schema_statements(std::string_view text) -> std::vector<SchemaStatement> {
    std::vector<SchemaStatement> statements;
    SchemaScanner scanner(text);
    while (auto statement = scanner.next()) {
        statements.push_back(std::move(*statement));
    }
    return statements;
}

auto scan_insert_statements(std::string_view text) -> std::vector<InsertStatement> {
    std::vector<InsertStatement> statements;
    InsertScanner scanner(text);
    while (auto statement = scanner.next()) {
        statements.push_back(std::move(*statement));
    }
    return statements;
}

auto parse_column_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> columns;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = text.find(',', start);
        std::string_view entry = text.substr(start, comma == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : comma - start);
        while (!entry.empty() && (is_space(entry.front()) || entry.front() == '`')) {
            entry.remove_prefix(1);
        }
        while (!entry.empty() && (is_space(entry.back()) || entry.back() == '`')) {
            entry.remove_suffix(1);
        }
        columns.emplace_back(entry);
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return columns;
}

}  // namespace dumpnav::parser

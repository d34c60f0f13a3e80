#include <dumpnav/parser/lexer.hpp>

namespace dumpnav::parser {

namespace {

constexpr auto to_upper(char ch) noexcept -> char {
    if (ch >= 'a' && ch <= 'z') {
        return static_cast<char>(ch - 'a' + 'A');
    }
    return ch;
}

}  // namespace

auto trim(std::string_view text) noexcept -> std::string_view {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

auto skip_space(std::string_view text, std::size_t pos) noexcept -> std::size_t {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

auto matches_at(std::string_view text, std::size_t pos, std::string_view keyword) noexcept
    -> bool {
    if (pos > text.size() || text.size() - pos < keyword.size()) {
        return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
        if (to_upper(text[pos + i]) != to_upper(keyword[i])) {
            return false;
        }
    }
    return true;
}

auto find_keyword(std::string_view text, std::string_view keyword, std::size_t from) noexcept
    -> std::size_t {
    if (keyword.empty()) {
        return from <= text.size() ? from : std::string_view::npos;
    }
    for (std::size_t pos = from; pos < text.size(); ++pos) {
        if (to_upper(text[pos]) == to_upper(keyword.front()) && matches_at(text, pos, keyword)) {
            return pos;
        }
    }
    return std::string_view::npos;
}

auto starts_with_phrase(std::string_view text, std::string_view phrase) noexcept -> bool {
    std::size_t pos = 0;
    std::size_t word_start = 0;
    while (word_start <= phrase.size()) {
        std::size_t word_end = phrase.find(' ', word_start);
        if (word_end == std::string_view::npos) {
            word_end = phrase.size();
        }
        const std::string_view word = phrase.substr(word_start, word_end - word_start);
        if (!matches_at(text, pos, word)) {
            return false;
        }
        pos += word.size();
        if (word_end == phrase.size()) {
            break;
        }
        const std::size_t after = skip_space(text, pos);
        if (after == pos) {
            return false;
        }
        pos = after;
        word_start = word_end + 1;
    }
    return pos >= text.size() || !is_ident_char(text[pos]);
}

}  // namespace dumpnav::parser

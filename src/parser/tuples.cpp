#include <dumpnav/parser/lexer.hpp>
#include <dumpnav/parser/tuples.hpp>

namespace dumpnav::parser {

auto split_tuples(std::string_view values_body) -> std::vector<std::string> {
    std::vector<std::string> tuples;
    QuoteState quotes;
    long depth = 0;
    std::size_t start = 0;

    const auto flush = [&](std::size_t end) {
        const std::string_view text = trim(values_body.substr(start, end - start));
        if (!text.empty()) {
            tuples.emplace_back(text);
        }
        start = end + 1;
    };

    for (std::size_t i = 0; i < values_body.size(); ++i) {
        const char ch = values_body[i];
        quotes.feed(ch);
        if (quotes.in_string) {
            continue;
        }
        if (ch == '(') {
            ++depth;
        } else if (ch == ')') {
            --depth;
        } else if (ch == ',' && depth == 0) {
            flush(i);
        }
    }
    if (start < values_body.size()) {
        flush(values_body.size());
    }
    return tuples;
}

}  // namespace dumpnav::parser

#include <dumpnav/view/table_view.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <type_traits>
#include <variant>

namespace dumpnav::view {

namespace {

auto to_lower_ascii(std::string_view text) -> std::string {
    std::string out(text);
    for (auto& ch : out) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }
    return out;
}

/// Number of code points, counting every byte that is not a UTF-8 continuation byte.
auto display_width(std::string_view text) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(
        text, [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0) != 0x80; }));
}

/// Byte offset at which `code_points` code points have been consumed.
auto byte_offset(std::string_view text, std::size_t code_points) -> std::size_t {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == code_points) {
                return i;
            }
            ++seen;
        }
    }
    return text.size();
}

auto fit_cell(std::string text) -> std::string {
    if (display_width(text) <= kMaxCellWidth) {
        return text;
    }
    text.resize(byte_offset(text, kMaxCellWidth - 3));
    text.append("...");
    return text;
}

void append_padded(std::string& out, std::string_view text, std::size_t width) {
    out.append(text);
    const std::size_t used = display_width(text);
    if (used < width) {
        out.append(width - used, ' ');
    }
}

}  // namespace

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, double>) {
                std::array<char, 64> buffer{};
                auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), v);
                std::string text = ec == std::errc{} ? std::string(buffer.data(), ptr)
                                                     : fmt::format("{}", v);
                if (text.find_first_of(".enr") == std::string::npos) {
                    text.append(".0");
                }
                return text;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto search_rows(const model::TableData& table, std::string_view query)
    -> std::vector<std::size_t> {
    if (query.empty()) {
        return all_rows(table);
    }
    const std::string needle = to_lower_ascii(query);
    std::vector<std::size_t> matches;
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const bool hit = std::ranges::any_of(table.rows[r], [&needle](const Value& cell) {
            return !is_null(cell) &&
                   to_lower_ascii(format_value(cell)).find(needle) != std::string::npos;
        });
        if (hit) {
            matches.push_back(r);
        }
    }
    return matches;
}

auto search_tables(const model::TableRegistry& tables, std::string_view query)
    -> std::vector<const model::TableData*> {
    const std::string needle = to_lower_ascii(query);
    std::vector<const model::TableData*> matches;
    for (const auto& table : tables) {
        if (to_lower_ascii(table.schema.name).find(needle) != std::string::npos) {
            matches.push_back(&table);
        }
    }
    return matches;
}

auto all_rows(const model::TableData& table) -> std::vector<std::size_t> {
    std::vector<std::size_t> rows(table.rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        rows[r] = r;
    }
    return rows;
}

auto page_count(std::size_t total, std::size_t page_size) noexcept -> std::size_t {
    if (page_size == 0 || total == 0) {
        return 1;
    }
    return (total + page_size - 1) / page_size;
}

auto clamp_window(std::size_t total, std::size_t offset, std::size_t count) noexcept -> Window {
    const std::size_t start = std::min(offset, total);
    return Window{.offset = start, .count = std::min(count, total - start)};
}

auto render_table(const model::TableData& table, const std::vector<std::size_t>& rows,
                  Window columns) -> std::string {
    const auto& names = table.schema.columns;
    const Window cols = clamp_window(names.size(), columns.offset, columns.count);
    if (cols.count == 0) {
        return "<empty>\n";
    }

    std::vector<std::size_t> widths(cols.count);
    std::vector<std::vector<std::string>> cells(rows.size());
    for (std::size_t c = 0; c < cols.count; ++c) {
        widths[c] = display_width(names[cols.offset + c]);
    }
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (rows[r] >= table.rows.size()) {
            continue;
        }
        const Row& row = table.rows[rows[r]];
        cells[r].resize(cols.count);
        for (std::size_t c = 0; c < cols.count; ++c) {
            if (cols.offset + c >= row.size()) {
                continue;
            }
            cells[r][c] = fit_cell(format_value(row[cols.offset + c]));
            widths[c] = std::max(widths[c], display_width(cells[r][c]));
        }
    }

    std::string out;
    const auto append_sep = [&]() {
        out.push_back('+');
        for (std::size_t c = 0; c < cols.count; ++c) {
            out.append(widths[c] + 2, '-');
            out.push_back('+');
        }
        out.push_back('\n');
    };
    const auto append_line = [&](const auto& text_at) {
        out.push_back('|');
        for (std::size_t c = 0; c < cols.count; ++c) {
            out.push_back(' ');
            append_padded(out, text_at(c), widths[c]);
            out.append(" |");
        }
        out.push_back('\n');
    };

    append_sep();
    append_line([&](std::size_t c) -> std::string_view { return names[cols.offset + c]; });
    append_sep();
    for (const auto& line : cells) {
        if (line.empty()) {
            continue;
        }
        append_line([&line](std::size_t c) -> std::string_view { return line[c]; });
    }
    append_sep();
    return out;
}

}  // namespace dumpnav::view

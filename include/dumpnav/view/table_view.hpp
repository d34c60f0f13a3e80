#pragma once

#include <dumpnav/core/value.hpp>
#include <dumpnav/model/registry.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dumpnav::view {

/// Cells wider than this are cut and suffixed with "...".
inline constexpr std::size_t kMaxCellWidth = 30;

/// A contiguous slice [offset, offset + count) of rows or columns.
struct Window {
    std::size_t offset = 0;
    std::size_t count = 0;

    [[nodiscard]] auto end() const noexcept -> std::size_t { return offset + count; }
};

/// Display text of a value: NULL, decimal integers, shortest round-trip floats
/// (always with a fractional part or exponent) and raw text.
[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// Indices of the rows in which some non-null cell contains `query`
/// (ASCII case-insensitive). An empty query matches every row.
[[nodiscard]] auto search_rows(const model::TableData& table, std::string_view query)
    -> std::vector<std::size_t>;

/// Tables whose name contains `query` (ASCII case-insensitive), in registry
/// order. An empty query matches every table.
[[nodiscard]] auto search_tables(const model::TableRegistry& tables, std::string_view query)
    -> std::vector<const model::TableData*>;

/// Every row index of the table, in order.
[[nodiscard]] auto all_rows(const model::TableData& table) -> std::vector<std::size_t>;

/// Number of pages of `page_size` needed for `total` items (at least 1).
[[nodiscard]] auto page_count(std::size_t total, std::size_t page_size) noexcept -> std::size_t;

/// Restrict [offset, offset + count) to [0, total).
[[nodiscard]] auto clamp_window(std::size_t total, std::size_t offset, std::size_t count) noexcept
    -> Window;

/// Render the selected rows and columns of a table as a text grid: a header,
/// a separator, one line per row and a closing separator.
[[nodiscard]] auto render_table(const model::TableData& table,
                                const std::vector<std::size_t>& rows, Window columns)
    -> std::string;

}  // namespace dumpnav::view

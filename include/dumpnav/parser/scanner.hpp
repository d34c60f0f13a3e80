#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dumpnav::parser {

/// `CREATE TABLE name (body) ENGINE=...`
struct SchemaStatement {
    std::string name;
    /// Text between the opening paren and the paren preceding `ENGINE=`.
    std::string body;
    /// Byte offset of the `CREATE` keyword in the scanned text.
    std::size_t offset = 0;
};

/// `INSERT INTO name [(columns)] VALUES body;`
struct InsertStatement {
    std::string name;
    std::optional<std::vector<std::string>> explicit_columns;
    std::string values_body;
    /// Byte offset of the `INSERT` keyword in the scanned text.
    std::size_t offset = 0;
};

/// Forward-only cursor over the schema statements of a dump.
///
/// A statement is recognised only when its closing paren is followed by the
/// `ENGINE=` storage marker before the next `CREATE TABLE`; candidates without
/// the marker are skipped.
class SchemaScanner {
   public:
    explicit SchemaScanner(std::string_view text) : text_(text) {}

    [[nodiscard]] auto next() -> std::optional<SchemaStatement>;

   private:
    auto match_at(std::size_t start) const -> std::optional<SchemaStatement>;

    std::string_view text_;
    std::size_t pos_ = 0;
};

/// Forward-only cursor over the INSERT statements of a dump.
///
/// The values body ends at the first `;` outside a single-quoted string.
class InsertScanner {
   public:
    explicit InsertScanner(std::string_view text) : text_(text) {}

    [[nodiscard]] auto next() -> std::optional<InsertStatement>;

   private:
    /// Returns the statement and the position just past its terminator.
    auto match_at(std::size_t start) const
        -> std::optional<std::pair<InsertStatement, std::size_t>>;

    std::string_view text_;
    std::size_t pos_ = 0;
};

[[nodiscard]] auto scan_schema_statements(std::string_view text) -> std::vector<SchemaStatement>;

[[nodiscard]] auto scan_insert_statements(std::string_view text) -> std::vector<InsertStatement>;

/// Split an explicit INSERT column list (`` `a`, `b` ``) into bare names.
[[nodiscard]] auto parse_column_list(std::string_view text) -> std::vector<std::string>;

}  // namespace dumpnav::parser

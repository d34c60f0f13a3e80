#pragma once

#include <dumpnav/core/value.hpp>
#include <dumpnav/parser/scanner.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dumpnav::model {

struct TableSchema {
    std::string name;
    std::vector<std::string> columns;
};

struct TableData {
    TableSchema schema;
    std::vector<Row> rows;
};

/// What to do with a positional (no column list) tuple whose length differs from
/// the table's column count.
enum class ArityPolicy : std::uint8_t {
    Keep,    // store the row as parsed
    Reject,  // drop the row
    Pad,     // pad with Null or truncate to the column count
};

enum class DiagnosticKind : std::uint8_t {
    TableFound,
    RowsInserted,
    EmptySchema,
    DuplicateTable,
    UnknownTable,
    ColumnCountMismatch,
    RowArityMismatch,
};

/// A recoverable parse event. Informational kinds (TableFound, RowsInserted)
/// are recorded alongside warnings so callers can report progress.
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::TableFound;
    std::string table;
    std::string message;

    [[nodiscard]] auto is_warning() const noexcept -> bool;
};

/// Everything the parse pass had to say, in encounter order.
struct ParseReport {
    std::vector<Diagnostic> diagnostics;

    /// Record a diagnostic and mirror it to spdlog (debug for informational
    /// kinds, warn otherwise).
    void add(DiagnosticKind kind, std::string table, std::string message);

    [[nodiscard]] auto count(DiagnosticKind kind) const noexcept -> std::size_t;
    [[nodiscard]] auto warnings() const noexcept -> std::size_t;
};

struct InsertOutcome {
    std::size_t appended = 0;
    std::size_t skipped = 0;
};

/// Ordered mapping from table name to TableData.
///
/// Iteration follows the order in which tables were first defined. Rows are
/// append-only.
class TableRegistry {
   public:
    using const_iterator = std::vector<TableData>::const_iterator;

    /// Register a table schema found at byte `offset` of the dump. A redefinition
    /// replaces the column list but keeps the table's position and rows; one
    /// without columns leaves the earlier list in place.
    void define(std::string name, std::vector<std::string> columns, ParseReport& report,
                std::size_t offset = 0);

    /// Apply one INSERT statement. See ArityPolicy for positional tuples.
    auto apply_insert(const parser::InsertStatement& statement, ArityPolicy policy,
                      ParseReport& report) -> InsertOutcome;

    [[nodiscard]] auto find(std::string_view name) const -> const TableData*;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return tables_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return tables_.empty(); }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return tables_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return tables_.end(); }

    /// Table names in definition order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// Sum of row counts over all tables.
    [[nodiscard]] auto total_rows() const noexcept -> std::size_t;

   private:
    auto find_mutable(std::string_view name) -> TableData*;

    std::vector<TableData> tables_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
};

/// Map an explicit-column tuple onto the schema's column order. Columns absent
/// from `columns` become Null; values without a matching schema column are dropped.
[[nodiscard]] auto project_row(const std::vector<std::string>& schema_columns,
                               const std::vector<std::string>& columns, const Row& values) -> Row;

}  // namespace dumpnav::model

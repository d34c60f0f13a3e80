#include <dumpnav/model/registry.hpp>
#include <dumpnav/parser/coerce.hpp>
#include <dumpnav/parser/tuples.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace dumpnav::model {

auto Diagnostic::is_warning() const noexcept -> bool {
    return kind != DiagnosticKind::TableFound && kind != DiagnosticKind::RowsInserted;
}

void ParseReport::add(DiagnosticKind kind, std::string table, std::string message) {
    Diagnostic diagnostic{.kind = kind, .table = std::move(table), .message = std::move(message)};
    if (diagnostic.is_warning()) {
        spdlog::warn("{}", diagnostic.message);
    } else {
        spdlog::debug("{}", diagnostic.message);
    }
    diagnostics.push_back(std::move(diagnostic));
}

auto ParseReport::count(DiagnosticKind kind) const noexcept -> std::size_t {
    return static_cast<std::size_t>(
        std::ranges::count_if(diagnostics, [kind](const Diagnostic& d) { return d.kind == kind; }));
}

auto ParseReport::warnings() const noexcept -> std::size_t {
    return static_cast<std::size_t>(
        std::ranges::count_if(diagnostics, [](const Diagnostic& d) { return d.is_warning(); }));
}

void TableRegistry::define(std::string name, std::vector<std::string> columns,
                           ParseReport& report, std::size_t offset) {
    if (columns.empty()) {
        report.add(DiagnosticKind::EmptySchema, name,
                   fmt::format("No columns found for table '{}' at byte {}.", name, offset));
    } else {
        report.add(DiagnosticKind::TableFound, name,
                   fmt::format("Found table: {} with columns: [{}]", name,
                               fmt::join(columns, ", ")));
    }

    if (auto* existing = find_mutable(name)) {
        if (columns.empty()) {
            report.add(DiagnosticKind::DuplicateTable, name,
                       fmt::format("Table '{}' is redefined at byte {} without columns; "
                                   "keeping the earlier definition.",
                                   name, offset));
            return;
        }
        report.add(DiagnosticKind::DuplicateTable, name,
                   fmt::format("Table '{}' is redefined at byte {}; using the last definition.",
                               name, offset));
        existing->schema.columns = std::move(columns);
        return;
    }
    const std::size_t pos = tables_.size();
    index_.emplace(name, pos);
    tables_.push_back(TableData{
        .schema = TableSchema{.name = std::move(name), .columns = std::move(columns)},
        .rows = {},
    });
}

auto TableRegistry::apply_insert(const parser::InsertStatement& statement, ArityPolicy policy,
                                 ParseReport& report) -> InsertOutcome {
    auto* table = find_mutable(statement.name);
    if (table == nullptr) {
        report.add(DiagnosticKind::UnknownTable, statement.name,
                   fmt::format("INSERT statement for unknown table '{}' at byte {}. Skipping.",
                               statement.name, statement.offset));
        return {};
    }

    const auto& schema_columns = table->schema.columns;
    const auto tuples = parser::split_tuples(statement.values_body);

    if (statement.explicit_columns.has_value() &&
        statement.explicit_columns->size() != schema_columns.size()) {
        report.add(DiagnosticKind::ColumnCountMismatch, statement.name,
                   fmt::format("Column count mismatch in INSERT INTO '{}' at byte {}. Expected {}, "
                               "got {}. Skipping these inserts.",
                               statement.name, statement.offset, schema_columns.size(),
                               statement.explicit_columns->size()));
        return InsertOutcome{.appended = 0, .skipped = tuples.size()};
    }

    InsertOutcome outcome;
    std::size_t mismatched = 0;
    for (const auto& tuple : tuples) {
        Row values = parser::parse_tuple(tuple);
        if (values.empty()) {
            ++outcome.skipped;
            continue;
        }
        if (statement.explicit_columns.has_value()) {
            table->rows.push_back(
                project_row(schema_columns, *statement.explicit_columns, values));
            ++outcome.appended;
            continue;
        }
        if (values.size() != schema_columns.size()) {
            ++mismatched;
            if (policy == ArityPolicy::Reject) {
                ++outcome.skipped;
                continue;
            }
            if (policy == ArityPolicy::Pad) {
                values.resize(schema_columns.size(), Value{Null{}});
            }
        }
        table->rows.push_back(std::move(values));
        ++outcome.appended;
    }

    if (mismatched > 0) {
        const char* action = policy == ArityPolicy::Reject ? "rejected"
                             : policy == ArityPolicy::Pad  ? "padded"
                                                           : "kept as parsed";
        report.add(DiagnosticKind::RowArityMismatch, statement.name,
                   fmt::format("{} row(s) in INSERT INTO '{}' at byte {} do not match its {} "
                               "columns ({}).",
                               mismatched, statement.name, statement.offset,
                               schema_columns.size(), action));
    }
    report.add(DiagnosticKind::RowsInserted, statement.name,
               fmt::format("Inserted {} rows into table '{}'.", outcome.appended, statement.name));
    return outcome;
}

auto TableRegistry::find(std::string_view name) const -> const TableData* {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return &tables_[it->second];
    }
    return nullptr;
}

auto TableRegistry::find_mutable(std::string_view name) -> TableData* {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return &tables_[it->second];
    }
    return nullptr;
}

auto TableRegistry::contains(std::string_view name) const -> bool {
    return find(name) != nullptr;
}

auto TableRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(tables_.size());
    for (const auto& table : tables_) {
        out.push_back(table.schema.name);
    }
    return out;
}

auto TableRegistry::total_rows() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& table : tables_) {
        total += table.rows.size();
    }
    return total;
}

auto project_row(const std::vector<std::string>& schema_columns,
                 const std::vector<std::string>& columns, const Row& values) -> Row {
    // Later duplicates of a column name win.
    robin_hood::unordered_flat_map<std::string, std::size_t> by_name;
    const std::size_t paired = std::min(columns.size(), values.size());
    for (std::size_t i = 0; i < paired; ++i) {
        by_name[columns[i]] = i;
    }

    Row row;
    row.reserve(schema_columns.size());
    for (const auto& column : schema_columns) {
        if (auto it = by_name.find(column); it != by_name.end()) {
            row.push_back(values[it->second]);
        } else {
            row.emplace_back(Null{});
        }
    }
    return row;
}

}  // namespace dumpnav::model

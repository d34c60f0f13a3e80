#include <dumpnav/loader/dump.hpp>
#include <dumpnav/view/table_view.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdio>
#include <map>
#include <string>
#include <vector>

namespace {

void print_tables(const dumpnav::model::TableRegistry& tables, const std::string& filter) {
    const auto matches = dumpnav::view::search_tables(tables, filter);
    if (matches.empty()) {
        fmt::print("No tables match '{}'.\n", filter);
        return;
    }
    fmt::print("Available Tables:\n");
    std::size_t number = 1;
    for (const auto* table : matches) {
        fmt::print("  {}. {} ({} columns, {} rows)\n", number++, table->schema.name,
                   table->schema.columns.size(), table->rows.size());
    }
}

void print_rows(const dumpnav::model::TableData& table, const std::string& query,
                std::size_t offset, std::size_t count, std::size_t column_offset,
                std::size_t column_count) {
    const auto matches = dumpnav::view::search_rows(table, query);
    if (matches.empty() && !query.empty()) {
        fmt::print("No rows match the search query.\n");
        return;
    }

    const auto rows = dumpnav::view::clamp_window(matches.size(), offset, count);
    const std::vector<std::size_t> shown(matches.begin() + static_cast<std::ptrdiff_t>(rows.offset),
                                         matches.begin() + static_cast<std::ptrdiff_t>(rows.end()));

    const std::size_t total_columns = table.schema.columns.size();
    const auto columns = dumpnav::view::clamp_window(
        total_columns, column_offset, column_count == 0 ? total_columns : column_count);

    fmt::print("{}", dumpnav::view::render_table(table, shown, columns));
    fmt::print("Rows: {}-{} of {} | Pages: {}/{}\n", rows.count == 0 ? 0 : rows.offset + 1,
               rows.end(), matches.size(), count == 0 ? 1 : rows.offset / count + 1,
               dumpnav::view::page_count(matches.size(), count));
    fmt::print("Columns: {}-{} of {}\n", columns.count == 0 ? 0 : columns.offset + 1,
               columns.end(), total_columns);
    fmt::print("Search: {}\n", query.empty() ? "Inactive" : "Active");
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"dumpnav: inspect the tables and rows of a SQL dump"};
    app.set_version_flag("--version", "dumpnav 0.1.0");

    std::string input_path;
    bool verbose = false;
    std::string table_name;
    std::string table_filter;
    std::string query;
    std::size_t row_count = 20;
    std::size_t row_offset = 0;
    std::size_t column_count = 0;
    std::size_t column_offset = 0;
    dumpnav::loader::ParseOptions options;

    const std::map<std::string, dumpnav::model::ArityPolicy> arity_names{
        {"keep", dumpnav::model::ArityPolicy::Keep},
        {"reject", dumpnav::model::ArityPolicy::Reject},
        {"pad", dumpnav::model::ArityPolicy::Pad},
    };

    app.add_option("filepath", input_path, "Path to the SQL dump file")->required();
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("-t,--table", table_name, "Show the rows of this table");
    app.add_option("-f,--find", table_filter,
                   "Only list tables whose name contains this text")
        ->excludes("--table");
    app.add_option("-s,--search", query, "Only show rows with a cell containing this text")
        ->needs("--table");
    app.add_option("-n,--rows", row_count, "Rows per page (default: 20)")->needs("--table");
    app.add_option("--offset", row_offset, "Index of the first row shown")->needs("--table");
    app.add_option("--columns", column_count, "Columns shown (default: all)")->needs("--table");
    app.add_option("--column-offset", column_offset, "Index of the first column shown")
        ->needs("--table");
    app.add_option("--arity", options.arity,
                   "Positional rows whose length differs from the schema: keep, reject or pad")
        ->transform(CLI::CheckedTransformer(arity_names, CLI::ignore_case));

    CLI11_PARSE(app, argc, argv);

    // Diagnostics are advisory: shown only on request.
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::err);

    auto dump = dumpnav::loader::load_dump(input_path, options);
    if (!dump) {
        fmt::print(stderr, "{}\n", dump.error().format());
        return 1;
    }

    const auto& tables = dump->tables;
    if (tables.empty()) {
        fmt::print("No tables found in the SQL dump.\n");
        return 0;
    }
    if (verbose) {
        spdlog::info("{} tables, {} rows, {} warnings", tables.size(), tables.total_rows(),
                     dump->report.warnings());
    }

    if (table_name.empty()) {
        print_tables(tables, table_filter);
        return 0;
    }

    const auto* table = tables.find(table_name);
    if (table == nullptr) {
        fmt::print(stderr, "dumpnav: no table named '{}'\n", table_name);
        return 1;
    }
    print_rows(*table, query, row_offset, row_count, column_offset, column_count);
    return 0;
}

#include <dumpnav/model/registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using dumpnav::model::ArityPolicy;
using dumpnav::model::DiagnosticKind;
using dumpnav::model::ParseReport;
using dumpnav::model::TableRegistry;
using dumpnav::parser::InsertStatement;

namespace {

auto insert(std::string table, std::string body,
            std::optional<std::vector<std::string>> columns = std::nullopt) -> InsertStatement {
    return InsertStatement{
        .name = std::move(table),
        .explicit_columns = std::move(columns),
        .values_body = std::move(body),
        .offset = 0,
    };
}

auto int_at(const dumpnav::Row& row, std::size_t i) -> std::int64_t {
    const auto* value = std::get_if<std::int64_t>(&row.at(i));
    REQUIRE(value != nullptr);
    return *value;
}

auto text_at(const dumpnav::Row& row, std::size_t i) -> std::string {
    const auto* value = std::get_if<std::string>(&row.at(i));
    REQUIRE(value != nullptr);
    return *value;
}

}  // namespace

TEST_CASE("Tables iterate in definition order", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("zeta", {"a"}, report);
    registry.define("alpha", {"b"}, report);
    registry.define("mid", {"c"}, report);

    REQUIRE(registry.size() == 3);
    REQUIRE(registry.names() == std::vector<std::string>{"zeta", "alpha", "mid"});
    REQUIRE(registry.contains("alpha"));
    REQUIRE_FALSE(registry.contains("ALPHA"));
    REQUIRE(report.count(DiagnosticKind::TableFound) == 3);
    REQUIRE(report.warnings() == 0);
}

TEST_CASE("Schema without columns is kept and reported", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("empty", {}, report);

    const auto* table = registry.find("empty");
    REQUIRE(table != nullptr);
    REQUIRE(table->schema.columns.empty());
    REQUIRE(report.count(DiagnosticKind::EmptySchema) == 1);
}

TEST_CASE("Redefinition replaces columns and keeps position", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("a", {"x"}, report);
    registry.define("b", {"y"}, report);
    registry.define("a", {"x", "z"}, report);

    REQUIRE(registry.names() == std::vector<std::string>{"a", "b"});
    REQUIRE(registry.find("a")->schema.columns == std::vector<std::string>{"x", "z"});
    REQUIRE(report.count(DiagnosticKind::DuplicateTable) == 1);
}

TEST_CASE("Insert into unknown table is discarded", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("users", {"id"}, report);

    auto outcome = registry.apply_insert(insert("ghosts", "(1),(2)"), ArityPolicy::Keep, report);
    REQUIRE(outcome.appended == 0);
    REQUIRE(registry.find("users")->rows.empty());
    REQUIRE_FALSE(registry.contains("ghosts"));
    REQUIRE(report.count(DiagnosticKind::UnknownTable) == 1);
}

TEST_CASE("Explicit column count mismatch rejects the statement", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("people", {"id", "name", "age"}, report);
    registry.apply_insert(insert("people", "(1,'Ann',30)"), ArityPolicy::Keep, report);

    auto outcome = registry.apply_insert(
        insert("people", "(2,'Bob'),(3,'Cy')", std::vector<std::string>{"id", "name"}),
        ArityPolicy::Keep, report);

    REQUIRE(outcome.appended == 0);
    REQUIRE(outcome.skipped == 2);
    REQUIRE(registry.find("people")->rows.size() == 1);
    REQUIRE(report.count(DiagnosticKind::ColumnCountMismatch) == 1);
}

TEST_CASE("Explicit columns are re-projected into schema order", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("people", {"id", "name", "age"}, report);

    auto outcome = registry.apply_insert(
        insert("people", "(7,'Bob',NULL)", std::vector<std::string>{"age", "name", "id"}),
        ArityPolicy::Keep, report);
    REQUIRE(outcome.appended == 1);

    const auto& row = registry.find("people")->rows.at(0);
    REQUIRE(row.size() == 3);
    REQUIRE(dumpnav::is_null(row[0]));
    REQUIRE(text_at(row, 1) == "Bob");
    REQUIRE(int_at(row, 2) == 7);
}

TEST_CASE("Columns missing from the explicit list become Null", "[model][registry]") {
    const std::vector<std::string> schema{"id", "name", "age"};
    const std::vector<std::string> columns{"name", "id"};
    const dumpnav::Row values{std::string("Bob"), std::int64_t{7}};

    auto row = dumpnav::model::project_row(schema, columns, values);
    REQUIRE(row.size() == 3);
    REQUIRE(int_at(row, 0) == 7);
    REQUIRE(text_at(row, 1) == "Bob");
    REQUIRE(dumpnav::is_null(row[2]));
}

TEST_CASE("Project row pairs only as many values as columns", "[model][registry]") {
    const std::vector<std::string> schema{"a", "b"};
    auto short_row = dumpnav::model::project_row(schema, {"a", "b"}, {std::int64_t{1}});
    REQUIRE(int_at(short_row, 0) == 1);
    REQUIRE(dumpnav::is_null(short_row[1]));

    auto unknown = dumpnav::model::project_row(schema, {"a", "nope"},
                                               {std::int64_t{1}, std::int64_t{2}});
    REQUIRE(int_at(unknown, 0) == 1);
    REQUIRE(dumpnav::is_null(unknown[1]));
}

TEST_CASE("Positional rows are stored as parsed by default", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("t", {"a", "b"}, report);

    auto outcome =
        registry.apply_insert(insert("t", "(1,2),(3),(4,5,6)"), ArityPolicy::Keep, report);
    REQUIRE(outcome.appended == 3);

    const auto& rows = registry.find("t")->rows;
    REQUIRE(rows[0].size() == 2);
    REQUIRE(rows[1].size() == 1);
    REQUIRE(rows[2].size() == 3);
    REQUIRE(report.count(DiagnosticKind::RowArityMismatch) == 1);
}

TEST_CASE("Arity policies reject or pad positional rows", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("t", {"a", "b"}, report);

    SECTION("reject") {
        auto outcome =
            registry.apply_insert(insert("t", "(1,2),(3),(4,5,6)"), ArityPolicy::Reject, report);
        REQUIRE(outcome.appended == 1);
        REQUIRE(outcome.skipped == 2);
        REQUIRE(registry.find("t")->rows.size() == 1);
    }

    SECTION("pad") {
        auto outcome =
            registry.apply_insert(insert("t", "(1,2),(3),(4,5,6)"), ArityPolicy::Pad, report);
        REQUIRE(outcome.appended == 3);
        const auto& rows = registry.find("t")->rows;
        for (const auto& row : rows) {
            REQUIRE(row.size() == 2);
        }
        REQUIRE(int_at(rows[1], 0) == 3);
        REQUIRE(dumpnav::is_null(rows[1][1]));
        REQUIRE(int_at(rows[2], 1) == 5);
    }
}

TEST_CASE("Rows accumulate across statements in encounter order", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("users", {"id", "name"}, report);
    registry.apply_insert(insert("users", "(1,'Alice')"), ArityPolicy::Keep, report);
    registry.apply_insert(insert("users", "(2,'Bob'),(3,'Cy')"), ArityPolicy::Keep, report);

    const auto& rows = registry.find("users")->rows;
    REQUIRE(rows.size() == 3);
    REQUIRE(int_at(rows[0], 0) == 1);
    REQUIRE(int_at(rows[1], 0) == 2);
    REQUIRE(int_at(rows[2], 0) == 3);
    REQUIRE(registry.total_rows() == 3);
    REQUIRE(report.count(DiagnosticKind::RowsInserted) == 2);
}

TEST_CASE("Empty tuples are skipped", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("t", {"a"}, report);

    auto outcome = registry.apply_insert(insert("t", "(),(1)"), ArityPolicy::Keep, report);
    REQUIRE(outcome.appended == 1);
    REQUIRE(outcome.skipped == 1);
}

TEST_CASE("Redefinition without columns keeps the earlier list", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("a", {"x", "y"}, report);
    registry.define("a", {}, report, 120);

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find("a")->schema.columns == std::vector<std::string>{"x", "y"});
    REQUIRE(report.count(DiagnosticKind::EmptySchema) == 1);
    REQUIRE(report.count(DiagnosticKind::DuplicateTable) == 1);
}

TEST_CASE("Warnings name the byte offset of the statement", "[model][registry]") {
    TableRegistry registry;
    ParseReport report;
    registry.define("t", {"a", "b"}, report);

    auto statement = insert("ghosts", "(1)");
    statement.offset = 42;
    registry.apply_insert(statement, ArityPolicy::Keep, report);

    statement = insert("t", "(1)", std::vector<std::string>{"a"});
    statement.offset = 99;
    registry.apply_insert(statement, ArityPolicy::Keep, report);

    REQUIRE(report.diagnostics.size() == 3);
    REQUIRE(report.diagnostics[1].message ==
            "INSERT statement for unknown table 'ghosts' at byte 42. Skipping.");
    REQUIRE(report.diagnostics[2].message.find("at byte 99") != std::string::npos);
}

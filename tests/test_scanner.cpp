#include <dumpnav/parser/scanner.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace dumpnav::parser;

TEST_CASE("Schema statement requires the ENGINE marker", "[parser][scanner]") {
    const char* text =
        "CREATE TABLE `users` (\n"
        "  `id` int NOT NULL,\n"
        "  `name` varchar(20)\n"
        ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;\n";

    auto statements = scan_schema_statements(text);
    REQUIRE(statements.size() == 1);
    REQUIRE(statements[0].name == "users");
    REQUIRE(statements[0].body == "\n  `id` int NOT NULL,\n  `name` varchar(20)\n");
    REQUIRE(statements[0].offset == 0);
}

TEST_CASE("Schema keywords are case-insensitive and the name may be bare", "[parser][scanner]") {
    auto statements = scan_schema_statements("create   table\torders (id int) engine = MyISAM;");
    REQUIRE(statements.size() == 1);
    REQUIRE(statements[0].name == "orders");
    REQUIRE(statements[0].body == "id int");
}

TEST_CASE("Schema body stops at the paren before ENGINE", "[parser][scanner]") {
    auto statements = scan_schema_statements(
        "CREATE TABLE t (a decimal(10,2), b enum('x)','y'), PRIMARY KEY (a)) ENGINE=InnoDB;");
    REQUIRE(statements.size() == 1);
    REQUIRE(statements[0].body == "a decimal(10,2), b enum('x)','y'), PRIMARY KEY (a)");
}

TEST_CASE("Schema without ENGINE marker is skipped", "[parser][scanner]") {
    const char* text =
        "CREATE TABLE a (x int);\n"
        "CREATE TABLE b (y int) ENGINE=InnoDB;\n";

    auto statements = scan_schema_statements(text);
    REQUIRE(statements.size() == 1);
    REQUIRE(statements[0].name == "b");
    REQUIRE(statements[0].body == "y int");
}

TEST_CASE("Schema scanner yields statements lazily in file order", "[parser][scanner]") {
    const char* text =
        "-- dump\n"
        "CREATE TABLE `first` (`a` int) ENGINE=InnoDB;\n"
        "INSERT INTO `first` VALUES (1);\n"
        "CREATE TABLE `second` (`b` int) ENGINE=InnoDB;\n";

    SchemaScanner scanner(text);
    auto first = scanner.next();
    REQUIRE(first.has_value());
    REQUIRE(first->name == "first");
    auto second = scanner.next();
    REQUIRE(second.has_value());
    REQUIRE(second->name == "second");
    REQUIRE_FALSE(scanner.next().has_value());
    REQUIRE_FALSE(scanner.next().has_value());
}

TEST_CASE("Insert statement without column list", "[parser][scanner]") {
    auto statements = scan_insert_statements("INSERT INTO `users` VALUES (1,'Alice'),(2,'Bob');");
    REQUIRE(statements.size() == 1);
    REQUIRE(statements[0].name == "users");
    REQUIRE_FALSE(statements[0].explicit_columns.has_value());
    REQUIRE(statements[0].values_body == "(1,'Alice'),(2,'Bob')");
}

TEST_CASE("Insert statement with explicit columns spanning lines", "[parser][scanner]") {
    const char* text =
        "INSERT INTO `users` (`id`, `name`) VALUES\n"
        "(1, 'Alice'),\n"
        "(2, 'Bob');\n";

    auto statements = scan_insert_statements(text);
    REQUIRE(statements.size() == 1);
    REQUIRE(statements[0].explicit_columns.has_value());
    REQUIRE(statements[0].explicit_columns->size() == 2);
    REQUIRE((*statements[0].explicit_columns)[0] == "id");
    REQUIRE((*statements[0].explicit_columns)[1] == "name");
    REQUIRE(statements[0].values_body == "(1, 'Alice'),\n(2, 'Bob')");
}

TEST_CASE("Insert body ignores semicolons inside strings", "[parser][scanner]") {
    auto statements = scan_insert_statements(
        "insert into notes values (1,'a; b'),(2,'it\\'s; fine');\nINSERT INTO notes VALUES (3,'c');");
    REQUIRE(statements.size() == 2);
    REQUIRE(statements[0].values_body == "(1,'a; b'),(2,'it\\'s; fine')");
    REQUIRE(statements[1].values_body == "(3,'c')");
}

TEST_CASE("Insert without terminator or VALUES is skipped", "[parser][scanner]") {
    REQUIRE(scan_insert_statements("INSERT INTO t VALUES (1)").empty());
    REQUIRE(scan_insert_statements("INSERT INTO t SELECT * FROM u;").empty());
    REQUIRE(scan_insert_statements("INSERT INTO t (a) VALUES;").empty());
}

TEST_CASE("Insert keyword glued to another word is not a statement", "[parser][scanner]") {
    REQUIRE(scan_insert_statements("REINSERT INTO t VALUES (1);").empty());
    REQUIRE(scan_insert_statements("INSERT INTO t VALUESX (1);").empty());
}

TEST_CASE("Explicit column list strips whitespace and backticks", "[parser][scanner]") {
    auto columns = parse_column_list(" `a`,b ,\n`c` ");
    REQUIRE(columns.size() == 3);
    REQUIRE(columns[0] == "a");
    REQUIRE(columns[1] == "b");
    REQUIRE(columns[2] == "c");
}

TEST_CASE("Explicit column list keeps empty entries", "[parser][scanner]") {
    auto columns = parse_column_list("a,,b");
    REQUIRE(columns.size() == 3);
    REQUIRE(columns[1].empty());
}

TEST_CASE("Insert statement without spaces around VALUES", "[parser][scanner]") {
    auto statements = scan_insert_statements("INSERT INTO t(a)VALUES(1);");
    REQUIRE(statements.size() == 1);
    REQUIRE(statements[0].name == "t");
    REQUIRE(statements[0].explicit_columns.has_value());
    REQUIRE(*statements[0].explicit_columns == std::vector<std::string>{"a"});
    REQUIRE(statements[0].values_body == "(1)");
}

#include <dumpnav/dumpnav.hpp>

#include <fmt/core.h>

auto main() -> int {
    constexpr const char* dump = R"sql(
CREATE TABLE `trades` (
  `id` int NOT NULL,
  `symbol` varchar(8) NOT NULL,
  `side` enum('buy','sell') NOT NULL,
  `price` decimal(10,2) DEFAULT NULL,
  PRIMARY KEY (`id`)
) ENGINE=InnoDB;

INSERT INTO `trades` VALUES (1,'A','buy',10.50),(2,'B','sell',NULL);
INSERT INTO `trades` (`symbol`, `id`, `price`, `side`) VALUES ('C, Inc.', 3, 99.9, 'buy');
)sql";

    // Decode a single tuple
    fmt::print("=== Tuple coercion ===\n");
    for (const auto& value : dumpnav::parser::parse_tuple("(7, 'O\\'Brien', NULL, -2.5)")) {
        fmt::print("{}: {}\n", dumpnav::kind_name(dumpnav::kind_of(value)),
                   dumpnav::view::format_value(value));
    }

    // Rebuild the whole model
    fmt::print("\n=== Dump ===\n");
    auto loaded = dumpnav::loader::parse_dump(dump);
    for (const auto& table : loaded.tables) {
        fmt::print("table {}: {} columns, {} rows\n", table.schema.name,
                   table.schema.columns.size(), table.rows.size());
        fmt::print("{}", dumpnav::view::render_table(
                             table, dumpnav::view::all_rows(table),
                             dumpnav::view::Window{.offset = 0,
                                                   .count = table.schema.columns.size()}));
    }
    fmt::print("{} diagnostics\n", loaded.report.diagnostics.size());

    return 0;
}

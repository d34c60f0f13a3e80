#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace dumpnav {

/// SQL NULL. Compares equal to every other Null.
struct Null {
    friend constexpr auto operator==(Null, Null) noexcept -> bool { return true; }
};

enum class ValueKind : std::uint8_t {
    Null,
    Integer,
    Float,
    Text,
};

/// A single typed cell decoded from an INSERT tuple.
///
/// Alternatives are ordered to match ValueKind.
using Value = std::variant<Null, std::int64_t, double, std::string>;

/// One tuple's worth of values, positionally aligned with the table's columns.
using Row = std::vector<Value>;

[[nodiscard]] constexpr auto kind_of(const Value& value) noexcept -> ValueKind {
    return static_cast<ValueKind>(value.index());
}

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<Null>(value);
}

/// Human-readable name of a value kind ("null", "integer", "float", "text").
[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> const char*;

}  // namespace dumpnav

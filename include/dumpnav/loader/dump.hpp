#pragma once

#include <dumpnav/model/registry.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace dumpnav::loader {

struct ParseOptions {
    model::ArityPolicy arity = model::ArityPolicy::Keep;
};

/// The reconstructed model plus the diagnostics gathered while building it.
struct LoadedDump {
    model::TableRegistry tables;
    model::ParseReport report;
};

/// Fatal failure to obtain the dump text. Parsing never starts when this is returned.
struct LoadError {
    enum class Kind : std::uint8_t {
        NotFound,
        Unreadable,
        InvalidEncoding,
    };

    Kind kind = Kind::Unreadable;
    std::string path;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

using LoadResult = std::expected<LoadedDump, LoadError>;

/// Offset of the first byte that does not belong to a well-formed UTF-8
/// sequence, or nullopt when the whole text is valid.
[[nodiscard]] auto find_invalid_utf8(std::string_view text) noexcept -> std::optional<std::size_t>;

/// Read a whole dump file into memory and check that it is valid UTF-8.
[[nodiscard]] auto read_dump_text(const std::string& path) -> std::expected<std::string, LoadError>;

/// Run the full extraction pass over dump text: every schema statement first,
/// then every INSERT statement, in file order. Never fails; malformed
/// statements are reported in LoadedDump::report and otherwise ignored.
[[nodiscard]] auto parse_dump(std::string_view text, const ParseOptions& options = {})
    -> LoadedDump;

/// read_dump_text followed by parse_dump.
[[nodiscard]] auto load_dump(const std::string& path, const ParseOptions& options = {})
    -> LoadResult;

}  // namespace dumpnav::loader

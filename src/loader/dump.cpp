#include <dumpnav/loader/dump.hpp>
#include <dumpnav/parser/columns.hpp>
#include <dumpnav/parser/scanner.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace dumpnav::loader {

namespace {

auto make_error(LoadError::Kind kind, const std::string& path, std::string message) -> LoadError {
    return LoadError{.kind = kind, .path = path, .message = std::move(message)};
}

/// Length of the UTF-8 sequence introduced by `lead`, 0 for an invalid lead byte.
constexpr auto sequence_length(unsigned char lead) noexcept -> std::size_t {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

}  // namespace

auto LoadError::format() const -> std::string {
    switch (kind) {
        case Kind::NotFound:
            return fmt::format("Error: File '{}' not found.", path);
        case Kind::InvalidEncoding:
            return fmt::format("Error reading file: '{}' is not valid UTF-8 ({})", path, message);
        case Kind::Unreadable:
            break;
    }
    return fmt::format("Error reading file: {}", message);
}

auto find_invalid_utf8(std::string_view text) noexcept -> std::optional<std::size_t> {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        const std::size_t length = sequence_length(lead);
        if (length == 0 || i + length > text.size()) {
            return i;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return i;
            }
        }
        if (length >= 3) {
            const auto second = static_cast<unsigned char>(text[i + 1]);
            // Reject overlong forms, UTF-16 surrogates and code points above U+10FFFF.
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
                (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
                return i;
            }
        }
        i += length;
    }
    return std::nullopt;
}

auto read_dump_text(const std::string& path) -> std::expected<std::string, LoadError> {
    std::error_code ec;
    const std::filesystem::path file_path(path);
    const bool exists = std::filesystem::exists(file_path, ec);
    if (ec) {
        return std::unexpected(make_error(LoadError::Kind::Unreadable, path, ec.message()));
    }
    if (!exists) {
        return std::unexpected(make_error(LoadError::Kind::NotFound, path, "no such file"));
    }
    if (std::filesystem::is_directory(file_path, ec)) {
        return std::unexpected(
            make_error(LoadError::Kind::Unreadable, path, fmt::format("'{}' is a directory", path)));
    }

    std::ifstream input(file_path, std::ios::binary);
    if (!input) {
        return std::unexpected(
            make_error(LoadError::Kind::Unreadable, path, fmt::format("cannot open '{}'", path)));
    }
    std::string text(std::istreambuf_iterator<char>{input}, {});
    if (input.bad()) {
        return std::unexpected(
            make_error(LoadError::Kind::Unreadable, path, fmt::format("failed to read '{}'", path)));
    }

    if (auto offset = find_invalid_utf8(text)) {
        return std::unexpected(make_error(LoadError::Kind::InvalidEncoding, path,
                                          fmt::format("invalid byte at offset {}", *offset)));
    }
    spdlog::debug("read {} bytes from {}", text.size(), path);
    return text;
}

auto parse_dump(std::string_view text, const ParseOptions& options) -> LoadedDump {
    LoadedDump dump;

    parser::SchemaScanner schemas(text);
    while (auto statement = schemas.next()) {
        dump.tables.define(std::move(statement->name),
                           parser::parse_column_definitions(statement->body), dump.report,
                           statement->offset);
    }

    parser::InsertScanner inserts(text);
    while (auto statement = inserts.next()) {
        dump.tables.apply_insert(*statement, options.arity, dump.report);
    }

    spdlog::debug("Parsing completed. Total tables parsed: {}.", dump.tables.size());
    return dump;
}

auto load_dump(const std::string& path, const ParseOptions& options) -> LoadResult {
    auto text = read_dump_text(path);
    if (!text.has_value()) {
        return std::unexpected(std::move(text.error()));
    }
    return parse_dump(*text, options);
}

}  // namespace dumpnav::loader

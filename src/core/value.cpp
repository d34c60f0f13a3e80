#include <dumpnav/core/value.hpp>

namespace dumpnav {

auto kind_name(ValueKind kind) noexcept -> const char* {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Integer:
            return "integer";
        case ValueKind::Float:
            return "float";
        case ValueKind::Text:
            return "text";
    }
    return "unknown";
}

}  // namespace dumpnav

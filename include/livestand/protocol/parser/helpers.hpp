#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string_view>
#include <system_error>

#include "livestand/protocol/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level, allocation-free helpers used by the envelope and snapshot parsers to
extract primitive JSON values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Resolve a field under its primary name or its alias
    (protobuf-JSON camelCase or proto field snake_case)
  • Parse primitive field types (bool, integer, number, string)
  • Accept integers encoded as JSON numbers or numeric strings
    (protobuf-JSON encodes 64-bit integers as strings)

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions
  - A JSON null is treated as an absent field

================================================================================
*/


namespace livestand::protocol::parser::helper {

// Field name with an optional alias
struct Key {
    const char* primary;
    const char* alias = nullptr;
};

// ============================================================================
// ROOT TYPE / LOOKUP
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// Returns true if the field exists (under either name) and is not null
[[nodiscard]]
inline bool lookup(const simdjson::dom::element& obj, Key key, simdjson::dom::element& out) noexcept {
    auto field = obj[key.primary];
    if (field.error() && key.alias != nullptr) {
        field = obj[key.alias];
    }
    if (field.error()) {
        return false;
    }
    out = field.value_unsafe();
    return out.type() != simdjson::dom::element_type::NULL_VALUE;
}

// ============================================================================
// NUMERIC CONVERSIONS
// ============================================================================

// JSON number or numeric string → int64
[[nodiscard]]
inline Result to_int64(const simdjson::dom::element& v, std::int64_t& out) noexcept {
    using simdjson::dom::element_type;
    switch (v.type()) {
        case element_type::INT64: {
            return v.get(out) ? Result::InvalidValue : Result::Parsed;
        }
        case element_type::UINT64: {
            std::uint64_t u{};
            if (v.get(u) || u > static_cast<std::uint64_t>(INT64_MAX)) {
                return Result::InvalidValue;
            }
            out = static_cast<std::int64_t>(u);
            return Result::Parsed;
        }
        case element_type::DOUBLE: {
            double d{};
            if (v.get(d) || !std::isfinite(d) || d != std::trunc(d)) {
                return Result::InvalidValue;
            }
            out = static_cast<std::int64_t>(d);
            return Result::Parsed;
        }
        case element_type::STRING: {
            std::string_view sv;
            if (v.get(sv) || sv.empty()) {
                return Result::InvalidValue;
            }
            const char* first = sv.data();
            const char* last  = sv.data() + sv.size();
            auto [ptr, ec] = std::from_chars(first, last, out);
            if (ec != std::errc{} || ptr != last) {
                return Result::InvalidValue;
            }
            return Result::Parsed;
        }
        default:
            return Result::InvalidValue;
    }
}

// JSON number or numeric string → double
[[nodiscard]]
inline Result to_double(const simdjson::dom::element& v, double& out) noexcept {
    using simdjson::dom::element_type;
    switch (v.type()) {
        case element_type::INT64:
        case element_type::UINT64:
        case element_type::DOUBLE: {
            // simdjson converts integer elements to double on request
            return v.get(out) ? Result::InvalidValue : Result::Parsed;
        }
        case element_type::STRING: {
            std::string_view sv;
            if (v.get(sv) || sv.empty()) {
                return Result::InvalidValue;
            }
            const char* last = sv.data() + sv.size();
            auto [ptr, ec] = std::from_chars(sv.data(), last, out);
            if (ec != std::errc{} || ptr != last) {
                return Result::InvalidValue;
            }
            return Result::Parsed;
        }
        default:
            return Result::InvalidValue;
    }
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, Key key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_required(const simdjson::dom::element& obj, Key key, std::int64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::InvalidSchema;
    }
    return to_int64(field, out);
}

[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& obj, Key key, simdjson::dom::array& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================
// On absence the output keeps its current (default) value and `present`
// is false. A present field of the wrong type is a schema error.

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, Key key, std::string_view& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, Key key, bool& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, Key key, std::int64_t& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::Parsed;
    }
    auto r = to_int64(field, out);
    if (r != Result::Parsed) {
        return r;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_double_optional(const simdjson::dom::element& obj, Key key, double& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::Parsed;
    }
    auto r = to_double(field, out);
    if (r != Result::Parsed) {
        return r;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& obj, Key key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup(obj, key, field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& obj, Key key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!lookup(obj, key, out)) {
        return Result::Parsed;
    }
    if (require_object(out) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

} // namespace livestand::protocol::parser::helper

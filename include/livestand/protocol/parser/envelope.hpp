#pragma once

#include <string>
#include <string_view>

#include "livestand/protocol/envelope.hpp"
#include "livestand/protocol/parser/helpers.hpp"
#include "livestand/protocol/parser/result.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace livestand::protocol::parser {

struct envelope {

    // Parses one text frame into an Envelope.
    //
    // - Missing "code" leaves CODE_MISSING (-1) in place
    // - "data" may be a string (opaque payload) or an embedded JSON
    //   object/array, which is re-serialized in minified form
    // - "message" is optional
    [[nodiscard]]
    static inline Result parse(simdjson::dom::parser& parser, std::string_view raw, Envelope& out) noexcept {
        out = Envelope{};

        simdjson::dom::element root;
        auto error = parser.parse(raw.data(), raw.size()).get(root);
        if (error) {
            LS_DEBUG("[PARSER] Envelope is not valid JSON (" << simdjson::error_message(error) << ") -> ignore message.");
            return Result::InvalidJson;
        }

        // Root must be an object
        if (helper::require_object(root) != Result::Parsed) {
            LS_DEBUG("[PARSER] Envelope root not an object -> ignore message.");
            return Result::InvalidSchema;
        }

        // code (optional, -1 when absent)
        std::int64_t code = CODE_MISSING;
        bool has_code = false;
        if (helper::parse_int64_optional(root, {"code"}, code, has_code) != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'code' invalid in envelope -> ignore message.");
            return Result::InvalidSchema;
        }
        out.code = has_code ? code : CODE_MISSING;

        // message (optional)
        std::string_view message;
        bool has_message = false;
        if (helper::parse_string_optional(root, {"message"}, message, has_message) != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'message' invalid in envelope -> ignore message.");
            return Result::InvalidSchema;
        }
        if (has_message) {
            out.message = std::string(message);
        }

        // data (optional, string or embedded JSON)
        simdjson::dom::element data;
        if (helper::lookup(root, {"data"}, data)) {
            std::string_view sv;
            if (data.get(sv) == simdjson::SUCCESS) {
                out.data = std::string(sv);
            }
            else if (data.type() == simdjson::dom::element_type::OBJECT ||
                     data.type() == simdjson::dom::element_type::ARRAY) {
                out.data = simdjson::minify(data);
            }
            else {
                LS_DEBUG("[PARSER] Field 'data' has unsupported type in envelope -> ignore message.");
                return Result::InvalidSchema;
            }
        }

        return Result::Parsed;
    }
};

} // namespace livestand::protocol::parser

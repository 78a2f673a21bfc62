#pragma once

#include <string>
#include <string_view>


namespace lcr {
namespace json {

// Appends `s` as the body of a JSON string literal (without the quotes)
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += HEX[(c >> 4) & 0x0F];
                    out += HEX[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

[[nodiscard]]
inline std::string escape(std::string_view s) {
    std::string out;
    append_escaped(out, s);
    return out;
}

} // namespace json
} // namespace lcr

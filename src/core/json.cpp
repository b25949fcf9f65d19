/**
 * @file json.cpp
 * @brief JSON string escaping.
 */

#include "core/json.hpp"

namespace wires {

std::string json_escape(std::string_view text) {
    static constexpr char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(text.size() + 8);

    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: {
                auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20) {
                    out += "\\u00";
                    out.push_back(kHex[byte >> 4]);
                    out.push_back(kHex[byte & 0x0F]);
                } else {
                    out.push_back(c);
                }
            }
        }
    }
    return out;
}

std::string json_quote(std::string_view text) {
    return '"' + json_escape(text) + '"';
}

}  // namespace wires

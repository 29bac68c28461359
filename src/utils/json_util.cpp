#include "../../include/utils/json_util.hpp"

#include <cstdio>
#include <sstream>

namespace postsched {

std::string JsonUtil::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string JsonUtil::inlineKeyboard(const std::vector<std::vector<InlineButton>>& rows) {
    std::ostringstream oss;
    oss << "{\"inline_keyboard\":[";
    for (size_t r = 0; r < rows.size(); r++) {
        if (r > 0) oss << ",";
        oss << "[";
        for (size_t b = 0; b < rows[r].size(); b++) {
            if (b > 0) oss << ",";
            oss << "{\"text\":\"" << escapeJson(rows[r][b].text) << "\","
                << "\"callback_data\":\"" << escapeJson(rows[r][b].callback_data) << "\"}";
        }
        oss << "]";
    }
    oss << "]}";
    return oss.str();
}

} // namespace postsched

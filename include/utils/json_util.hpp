#ifndef POSTSCHED_JSON_UTIL_HPP
#define POSTSCHED_JSON_UTIL_HPP

#include <string>
#include <vector>

namespace postsched {

struct InlineButton {
    std::string text;
    std::string callback_data;
};

class JsonUtil {
public:
    static std::string escapeJson(const std::string& str);
    // {"inline_keyboard":[[{"text":..,"callback_data":..},..],..]}
    static std::string inlineKeyboard(const std::vector<std::vector<InlineButton>>& rows);
};

} // namespace postsched

#endif // POSTSCHED_JSON_UTIL_HPP

#ifndef POSTSCHED_ERROR_CLASSIFIER_HPP
#define POSTSCHED_ERROR_CLASSIFIER_HPP

#include <string>
#include "../scheduler/models.hpp"

namespace postsched {

// Telegram Bot API failure. `http_status` is 0 when no response arrived
// (network error or timeout).
DeliveryError classifyTelegramError(long http_status, const std::string& description);

// VK API error object code (error.error_code).
DeliveryError classifyVkError(int error_code);

} // namespace postsched

#endif // POSTSCHED_ERROR_CLASSIFIER_HPP

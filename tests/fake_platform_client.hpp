#ifndef POSTSCHED_TESTS_FAKE_PLATFORM_CLIENT_HPP
#define POSTSCHED_TESTS_FAKE_PLATFORM_CLIENT_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "platform/platform_client.hpp"

// Scriptable stand-in for the Telegram/VK client. Unscripted deliveries succeed.
class FakePlatformClient : public postsched::PlatformClient {
public:
    struct Call {
        std::string method;
        int64_t target = 0;
    };

    struct Sent {
        int64_t chat_id = 0;
        std::string text;
        std::string reply_markup;
        std::string parse_mode;
    };

    std::map<int64_t, postsched::DeliveryResult> forward_results;
    std::map<int64_t, postsched::DeliveryResult> copy_results;
    std::map<int64_t, postsched::DeliveryResult> post_results;

    std::vector<postsched::ChannelTarget> vk_groups;
    bool vk_fails = false;

    std::vector<postsched::Update> pending_updates;

    postsched::DeliveryResult forward(const postsched::SourceRef&, const postsched::ChannelTarget& target) override {
        return record("forward", target, forward_results);
    }

    postsched::DeliveryResult copy(const postsched::SourceRef&, const postsched::ChannelTarget& target) override {
        return record("copy", target, copy_results);
    }

    postsched::DeliveryResult postToWall(const postsched::SourceRef& source,
                                         const postsched::ChannelTarget& target) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_caption = source.caption;
            last_photo = source.photo_file_id;
        }
        return record("post", target, post_results);
    }

    bool sendText(int64_t chat_id, const std::string& text,
                  const std::string& reply_markup_json, const std::string& parse_mode) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent.push_back({chat_id, text, reply_markup_json, parse_mode});
        return true;
    }

    bool answerCallback(const std::string& callback_id, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        answered.push_back(callback_id);
        return true;
    }

    bool getUpdates(int64_t offset, int, std::vector<postsched::Update>& out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_offset = offset;
        out.clear();
        for (const auto& u : pending_updates) {
            if (u.update_id >= offset) out.push_back(u);
        }
        return true;
    }

    bool listVkGroups(std::vector<postsched::ChannelTarget>& out, std::string& error) override {
        if (vk_fails) {
            error = "groups.get: 5 User authorization failed";
            return false;
        }
        out = vk_groups;
        return true;
    }

    int count(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& c : calls) {
            if (c.method == method) n++;
        }
        return n;
    }

    std::vector<Call> calls;
    std::vector<Sent> sent;
    std::vector<std::string> answered;
    std::string last_caption;
    std::string last_photo;
    int64_t last_offset = -1;

private:
    postsched::DeliveryResult record(const std::string& method,
                                     const postsched::ChannelTarget& target,
                                     const std::map<int64_t, postsched::DeliveryResult>& scripted) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back({method, target.external_id});
        auto it = scripted.find(target.external_id);
        if (it != scripted.end()) return it->second;
        return postsched::DeliveryResult::success(method + "-" + std::to_string(target.external_id));
    }

    std::mutex mutex_;
};

#endif // POSTSCHED_TESTS_FAKE_PLATFORM_CLIENT_HPP

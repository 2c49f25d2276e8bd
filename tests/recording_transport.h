#pragma once

#include <core/network/transport/transport.h>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace lanlink::test {

using core::Endpoint;

// In-memory transport: records every datagram and optionally hands it to a hook, which
// runs synchronously on the sending thread.
class RecordingTransport : public core::Transport {
public:
    struct Sent {
        std::string payload;
        Endpoint target;
        bool broadcast;
    };
    using Hook = std::function<void(const std::string& payload, const Endpoint& target)>;

    bool SendTo(std::string_view payload, const Endpoint& target) override {
        return record(payload, target, false);
    }

    bool Broadcast(std::string_view payload) override {
        return record(payload, Endpoint{}, true);
    }

    void SetHook(Hook hook) { hook_ = std::move(hook); }
    void SetFailing(bool failing) { failing_ = failing; }

    std::vector<Sent> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::vector<std::string> payloads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& s : sent_) {
            result.push_back(s.payload);
        }
        return result;
    }

    std::size_t CountPrefix(std::string_view prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& s : sent_) {
            if (std::string_view(s.payload).substr(0, prefix.size()) == prefix) {
                ++count;
            }
        }
        return count;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

private:
    bool record(std::string_view payload, const Endpoint& target, bool broadcast) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(Sent{std::string(payload), target, broadcast});
        }
        if (failing_) {
            return false;
        }
        if (hook_) {
            hook_(std::string(payload), target);
        }
        return true;
    }

    mutable std::mutex mutex_;
    std::vector<Sent> sent_;
    Hook hook_;
    bool failing_ = false;
};

inline Endpoint MakeEndpoint(const char* address, unsigned short port) {
    return Endpoint(boost::asio::ip::make_address(address), port);
}

} // namespace lanlink::test

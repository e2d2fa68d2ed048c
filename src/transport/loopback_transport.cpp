/// @file src/transport/loopback_transport.cpp
/// @brief LoopbackTransport — in-process publish/subscribe with failure injection.

#include "aqs/transport.hpp"

#include "aqs/payload.hpp"

#include <algorithm>
#include <utility>

namespace aqs::transport {

bool LoopbackTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++connect_calls_;
    if (failing_connects_ > 0) {
        --failing_connects_;
        return false;
    }
    connected_ = true;
    return true;
}

bool LoopbackTransport::subscribe(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return false;
    }
    if (failing_subscribes_ > 0) {
        --failing_subscribes_;
        return false;
    }
    if (std::find(patterns_.begin(), patterns_.end(), pattern) == patterns_.end()) {
        patterns_.push_back(pattern);
    }
    return true;
}

void LoopbackTransport::set_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void LoopbackTransport::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    patterns_.clear();
}

bool LoopbackTransport::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool LoopbackTransport::publish(std::string_view topic, std::string_view payload) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_ || !handler_) {
            return false;
        }
        const bool matched =
            std::any_of(patterns_.begin(), patterns_.end(), [topic](const std::string& p) {
                return ingest::topic_matches(p, topic);
            });
        if (!matched) {
            return false;
        }
        handler = handler_;
    }
    handler(topic, payload);
    return true;
}

void LoopbackTransport::fail_next_connects(unsigned n) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_connects_ = n;
}

void LoopbackTransport::fail_next_subscribes(unsigned n) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_subscribes_ = n;
}

std::vector<std::string> LoopbackTransport::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return patterns_;
}

std::size_t LoopbackTransport::connect_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_calls_;
}

}  // namespace aqs::transport

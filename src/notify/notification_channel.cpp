/**
 * @file notification_channel.cpp
 * @brief Notification channel implementations.
 * @author Dimitris Kafetzis
 */

#include "notify/notification_channel.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace code_sandbox {

// ── InMemoryNotificationChannel ──────────────

void InMemoryNotificationChannel::register_handle(const DeliveryHandle& handle, Callback callback) {
    std::lock_guard lock(mutex_);
    handles_.insert_or_assign(handle, std::move(callback));
}

void InMemoryNotificationChannel::unregister_handle(const DeliveryHandle& handle) {
    std::lock_guard lock(mutex_);
    handles_.erase(handle);
}

Result<void> InMemoryNotificationChannel::publish(const DeliveryHandle& handle,
                                                  std::string_view payload) {
    Callback callback;
    {
        std::lock_guard lock(mutex_);
        auto it = handles_.find(handle);
        if (it == handles_.end()) {
            return Error{ErrorCode::ChannelGone, "No live recipient for handle " + handle};
        }
        callback = it->second;
    }

    callback(payload);

    std::lock_guard lock(mutex_);
    ++delivered_;
    return Result<void>{};
}

size_t InMemoryNotificationChannel::handle_count() const {
    std::lock_guard lock(mutex_);
    return handles_.size();
}

size_t InMemoryNotificationChannel::delivered_count() const {
    std::lock_guard lock(mutex_);
    return delivered_;
}

// ── StreamNotificationChannel ────────────────

StreamNotificationChannel::StreamNotificationChannel(std::ostream& out, std::mutex& out_mutex)
    : out_(out), out_mutex_(out_mutex) {}

Result<void> StreamNotificationChannel::publish(const DeliveryHandle& handle,
                                                std::string_view payload) {
    auto envelope = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (envelope.is_discarded()) {
        return Error{ErrorCode::Internal, "Delivery payload is not valid JSON"};
    }
    nlohmann::json line = {{"handle", handle}, {"payload", std::move(envelope)}};

    std::lock_guard lock(out_mutex_);
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_) {
        return Error{ErrorCode::ChannelUnavailable, "Output stream is not writable"};
    }
    return Result<void>{};
}

}  // namespace code_sandbox

/**
 * @file notification_channel.hpp
 * @brief Out-of-band delivery of async execution results.
 * @author Dimitris Kafetzis
 *
 * A delivery handle is an opaque token owned by whatever sits behind the
 * channel (a websocket registry, a pub/sub topic, a line on stdout). The
 * engine publishes by handle and does not track whether the recipient is
 * still listening.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace code_sandbox {

// ─────────────────────────────────────────────
// INotificationChannel (virtual, runtime-configurable)
// ─────────────────────────────────────────────

class INotificationChannel {
public:
    virtual ~INotificationChannel() = default;

    /**
     * @brief Push one serialized payload to the recipient behind `handle`.
     *
     * ChannelGone when the handle is unknown or closed (the result is lost
     * and must not be retried); ChannelUnavailable for transient failures.
     */
    virtual Result<void> publish(const DeliveryHandle& handle, std::string_view payload) = 0;
};

// ─────────────────────────────────────────────
// InMemoryNotificationChannel
// ─────────────────────────────────────────────

/**
 * @brief Registry of live handles, each bound to a callback.
 *
 * Stands in for a connection table: a handle exists from register_handle()
 * until unregister_handle(). Callbacks run on the publishing thread,
 * outside the registry lock.
 */
class InMemoryNotificationChannel : public INotificationChannel {
public:
    using Callback = std::function<void(std::string_view payload)>;

    void register_handle(const DeliveryHandle& handle, Callback callback);
    void unregister_handle(const DeliveryHandle& handle);

    Result<void> publish(const DeliveryHandle& handle, std::string_view payload) override;

    [[nodiscard]] size_t handle_count() const;
    [[nodiscard]] size_t delivered_count() const;

private:
    std::unordered_map<DeliveryHandle, Callback> handles_;
    size_t delivered_{0};
    mutable std::mutex mutex_;
};

// ─────────────────────────────────────────────
// StreamNotificationChannel
// ─────────────────────────────────────────────

/**
 * @brief Writes each delivery as one NDJSON line {"handle","payload"}.
 *
 * Every handle is considered live. A stream in a failed state reports
 * ChannelUnavailable.
 */
class StreamNotificationChannel : public INotificationChannel {
public:
    explicit StreamNotificationChannel(std::ostream& out, std::mutex& out_mutex);

    Result<void> publish(const DeliveryHandle& handle, std::string_view payload) override;

private:
    std::ostream& out_;
    std::mutex& out_mutex_;   ///< Shared with other writers of the same stream
};

}  // namespace code_sandbox

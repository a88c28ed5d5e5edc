/*
 * AddonKit - Addon configuration, storage and signalling runtime
 * Copyright (C) 2026 AddonKit Authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

/**
 * ============================================================================
 * AddonKit SignalChannel - HEADER
 * ============================================================================
 *
 * @file SignalChannel.hpp
 * @brief One named event kind with its own subscriber set.
 *
 * Subscribers are identified by the shared handle returned from Subscribe().
 * Subscribing the same handle twice is a no-op; Unsubscribe() removes by
 * handle. Emit() invokes subscribers synchronously in subscription order.
 *
 * A subscriber that throws is logged with the channel name and skipped;
 * delivery continues and nothing reaches the emitter.
 *
 * Re-entrancy:
 * ------------
 * Emit() walks the live subscriber list by index. Subscribing or
 * unsubscribing from inside a callback is permitted but logged as a warning.
 * A subscriber added during emission may be invoked in the same pass. A
 * subscriber removed during emission is left as an empty slot until the
 * outermost Emit() returns, so removal never shifts a later subscriber out of
 * the current pass.
 *
 * Thread Safety:
 * --------------
 * None. Channels belong to the host's single cooperative thread.
 */

#include "../Utils/Logger.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace AddonKit {
namespace Signals {

template <typename Event>
class SignalChannel {
public:
    using Callback = std::function<void(const Event&)>;
    using CallbackHandle = std::shared_ptr<const Callback>;

    explicit SignalChannel(std::string name)
        : m_name(std::move(name)) {
    }

    SignalChannel(const SignalChannel&) = delete;
    SignalChannel& operator=(const SignalChannel&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept { return m_name; }

    /**
     * @brief Add a subscriber.
     * @return @p handle, for a later Unsubscribe()
     */
    CallbackHandle Subscribe(CallbackHandle handle) {
        if (!handle || !*handle) {
            AK_LOG_WARN("Signals", "%s: ignoring empty subscriber", m_name.c_str());
            return handle;
        }
        WarnIfEmitting("subscribe");

        if (std::find(m_subscribers.begin(), m_subscribers.end(), handle) == m_subscribers.end()) {
            m_subscribers.push_back(handle);
        }
        return handle;
    }

    /**
     * @brief Wrap @p callback in a new handle and subscribe it.
     */
    CallbackHandle Subscribe(Callback callback) {
        return Subscribe(std::make_shared<const Callback>(std::move(callback)));
    }

    /// @brief Remove a subscriber. Unknown handles are ignored.
    void Unsubscribe(const CallbackHandle& handle) {
        WarnIfEmitting("unsubscribe");

        if (!handle) {
            return;
        }
        const auto it = std::find(m_subscribers.begin(), m_subscribers.end(), handle);
        if (it == m_subscribers.end()) {
            return;
        }
        if (m_emitDepth > 0) {
            it->reset();
            m_hasEmptySlots = true;
        }
        else {
            m_subscribers.erase(it);
        }
    }

    /**
     * @brief Deliver @p event to every current subscriber.
     */
    void Emit(const Event& event) {
        ++m_emitDepth;
        for (size_t i = 0; i < m_subscribers.size(); ++i) {
            // Keep the callback alive even if it unsubscribes itself.
            const CallbackHandle handle = m_subscribers[i];
            if (!handle) {
                continue;
            }
            try {
                (*handle)(event);
            }
            catch (const std::exception& ex) {
                AK_LOG_ERROR("Signals", "Error @%s subscriber: %s", m_name.c_str(), ex.what());
            }
            catch (...) {
                AK_LOG_ERROR("Signals", "Error @%s subscriber: unknown exception", m_name.c_str());
            }
        }
        if (--m_emitDepth == 0 && m_hasEmptySlots) {
            m_subscribers.erase(std::remove(m_subscribers.begin(), m_subscribers.end(), nullptr),
                m_subscribers.end());
            m_hasEmptySlots = false;
        }
    }

    [[nodiscard]] size_t SubscriberCount() const noexcept {
        return static_cast<size_t>(std::count_if(m_subscribers.begin(), m_subscribers.end(),
            [](const CallbackHandle& handle) { return handle != nullptr; }));
    }

    [[nodiscard]] bool IsEmitting() const noexcept { return m_emitDepth > 0; }

private:
    void WarnIfEmitting(const char* operation) const {
        if (m_emitDepth > 0) {
            AK_LOG_WARN("Signals", "%s: %s during emit; delivery order for this pass is not guaranteed",
                m_name.c_str(), operation);
        }
    }

    std::string m_name;
    std::vector<CallbackHandle> m_subscribers;
    size_t m_emitDepth = 0;
    bool m_hasEmptySlots = false;
};

} // namespace Signals
} // namespace AddonKit

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
 * @file SignalHub.hpp
 * @brief The four addon event channels, held in one context object.
 *
 * Construct one hub per process and pass it by reference to whatever needs
 * to publish or subscribe. The hub is neither copyable nor resettable.
 */

#include "Events.hpp"
#include "SignalChannel.hpp"

namespace AddonKit {
namespace Signals {

class SignalHub {
public:
    SignalHub();

    SignalHub(const SignalHub&) = delete;
    SignalHub& operator=(const SignalHub&) = delete;

    SignalChannel<AddonReadyEvent> OnAddonReady;
    SignalChannel<SettingsChangedEvent> OnSettingsChanged;
    SignalChannel<ExtensionTriggeredEvent> OnExtensionTriggered;
    SignalChannel<CustomSignalEmittedEvent> OnCustomSignalEmitted;

    /// @brief Subscribers across all four channels.
    [[nodiscard]] size_t TotalSubscriberCount() const noexcept;
};

} // namespace Signals
} // namespace AddonKit

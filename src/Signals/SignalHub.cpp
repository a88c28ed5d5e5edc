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
#include "SignalHub.hpp"

namespace AddonKit {
namespace Signals {

SignalHub::SignalHub()
    : OnAddonReady("OnAddonReadyEvent")
    , OnSettingsChanged("OnSettingsChangedEvent")
    , OnExtensionTriggered("OnExtensionTriggeredEvent")
    , OnCustomSignalEmitted("OnCustomSignalEmittedEvent") {
}

size_t SignalHub::TotalSubscriberCount() const noexcept {
    return OnAddonReady.SubscriberCount()
        + OnSettingsChanged.SubscriberCount()
        + OnExtensionTriggered.SubscriberCount()
        + OnCustomSignalEmitted.SubscriberCount();
}

} // namespace Signals
} // namespace AddonKit

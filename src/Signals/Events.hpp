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
 * @file Events.hpp
 * @brief Payloads carried by the Signal Hub channels.
 */

#include "../Addon/AddonData.hpp"
#include "../Addon/HostRuntime.hpp"

#include <optional>
#include <string>

namespace AddonKit {
namespace Signals {

/// @brief The host is ready and this addon has announced itself.
struct AddonReadyEvent {
    Addon::AddonData addonData;
};

struct SettingsChangedEvent {
    Addon::Json settingsData;
    std::optional<Addon::Actor> actor;
};

struct ExtensionTriggeredEvent {
    std::string extensionId;
    Addon::Actor actor;
};

/**
 * @brief A signal emitted by any addon on the host.
 *
 * Both ids arrive lower-cased. @c data is absent when the emitter sent none.
 */
struct CustomSignalEmittedEvent {
    std::string addonId;
    std::string emitterId;
    std::optional<Addon::Json> data;
};

} // namespace Signals
} // namespace AddonKit

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
 * @file HostRuntime.hpp
 * @brief Broadcast channel and actor lookup exposed by the host runtime.
 *
 * Messages are (id, text) pairs. Message ids used by the addon protocol:
 *
 *   inbound   acm:engine_ready                      host is ready for addons
 *   inbound   ACM:SIGNAL.<ADDON>.<EMITTER>          cross-addon custom signal
 *   inbound   acm:ext_<author>_<packId>             extension trigger
 *   outbound  acm:addon_ready                       addon descriptor JSON
 *   outbound  acm:hud_home / acm:hud_addon          UI form requests
 */

#include <optional>
#include <string>

namespace AddonKit {
namespace Addon {

namespace Protocol {
    inline constexpr const char* ENGINE_READY = "acm:engine_ready";
    inline constexpr const char* ADDON_READY = "acm:addon_ready";
    inline constexpr const char* HUD_HOME = "acm:hud_home";
    inline constexpr const char* HUD_ADDON = "acm:hud_addon";
    inline constexpr const char* SIGNAL_PREFIX = "ACM:SIGNAL.";
    inline constexpr const char* EXTENSION_PREFIX = "acm:ext_";

    /// Signal payload meaning "no data"
    inline constexpr const char* VOID_PAYLOAD = "void";
}

/**
 * @brief An entity in the host (typically a player) that triggered an event.
 */
struct Actor {
    std::string id;
    std::string name;

    bool operator==(const Actor& other) const noexcept { return id == other.id && name == other.name; }
};

/**
 * @brief Host-side services consumed by the addon facade.
 */
class IHostRuntime {
public:
    virtual ~IHostRuntime() = default;

    /// @brief Send a message on the host-wide broadcast channel.
    virtual void SendBroadcast(const std::string& id, const std::string& message) = 0;

    /// @brief Resolve an actor by id. nullopt if it no longer exists.
    [[nodiscard]] virtual std::optional<Actor> FindActor(const std::string& actorId) = 0;
};

} // namespace Addon
} // namespace AddonKit

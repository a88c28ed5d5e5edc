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
 * AddonKit AddonLibrary - HEADER
 * ============================================================================
 *
 * @file AddonLibrary.hpp
 * @brief Per-addon facade between the host runtime, the Signal Hub and storage.
 *
 * Responsibilities:
 * -----------------
 * - Owns the addon descriptor and the identity derived from it
 * - Decodes inbound host broadcasts into Signal Hub events
 * - Encodes outbound signals and UI form requests
 * - Appends to the shared addon log ledger
 * - Resolves settings stored by the host UI in per-addon ledgers
 * - Exposes the Directory Registry bound to this addon's identity
 *
 * Usage Example:
 * --------------
 * @code
 * Signals::SignalHub hub;
 * Addon::AddonLibrary acm(store, host, hub);
 *
 * Error err;
 * if (!acm.InitAddon(data, &err)) { ... }
 *
 * acm.Events().OnAddonReady.Subscribe([&](const Signals::AddonReadyEvent&) {
 *     auto logs = acm.Fs().New("logs", true);
 * });
 *
 * // From the host's broadcast callback:
 * acm.HandleHostMessage(id, message);
 * @endcode
 *
 * Thread Safety:
 * --------------
 * None. All calls run on the host's cooperative thread.
 */

#include "AddonData.hpp"
#include "HostRuntime.hpp"
#include "../Core/Error.hpp"
#include "../FileSystem/DirectoryRegistry.hpp"
#include "../Ledger/LedgerStore.hpp"
#include "../Signals/SignalHub.hpp"

#include <optional>
#include <string>

namespace AddonKit {
namespace Addon {

inline constexpr const char* DEFAULT_LOG_LEDGER = "ACM:LOG";
inline constexpr const char* DEFAULT_SETTINGS_PREFIX = "ACM:";

struct AddonOptions {
    std::string logLedger = DEFAULT_LOG_LEDGER;
    std::string settingsPrefix = DEFAULT_SETTINGS_PREFIX;
    FileSystem::RegistryOptions fileSystem;
};

class AddonLibrary {
public:
    AddonLibrary(Ledger::ILedgerStore& store, IHostRuntime& host, Signals::SignalHub& hub,
                 AddonOptions options = {});

    AddonLibrary(const AddonLibrary&) = delete;
    AddonLibrary& operator=(const AddonLibrary&) = delete;

    // ========================================================================
    // Identity
    // ========================================================================

    /**
     * @brief Establish the addon descriptor. Allowed once.
     * @return false with AlreadyInitialized on a second call
     */
    [[nodiscard]] bool InitAddon(AddonData data, Error* err = nullptr);

    [[nodiscard]] bool IsInitialized() const noexcept { return m_addonData.has_value(); }

    [[nodiscard]] const std::optional<AddonData>& GetAddonData() const noexcept { return m_addonData; }

    /// @brief "<author>_<packId>", or nullopt before InitAddon.
    [[nodiscard]] std::optional<std::string> Identifier() const;

    // ========================================================================
    // Host protocol
    // ========================================================================

    /**
     * @brief Decode one inbound broadcast.
     *
     * Unrelated messages are ignored and return true. Malformed signal or
     * extension payloads are logged, dropped and reported through @p err.
     */
    [[nodiscard]] bool HandleHostMessage(const std::string& id, const std::string& message,
                                         Error* err = nullptr);

    /**
     * @brief Broadcast ACM:SIGNAL.<IDENTITY>.<EVENTID> to every addon.
     * @param data Payload; absent or null is sent as "void"
     */
    [[nodiscard]] bool Emit(const std::string& eventId, const std::optional<Json>& data = std::nullopt,
                            Error* err = nullptr);

    /// @brief Ask the host UI to show its home form to @p actor.
    void ShowHomeForm(const Actor& actor);

    /// @brief Ask the host UI to show this addon's page to @p actor.
    [[nodiscard]] bool ShowAddonForm(const Actor& actor, Error* err = nullptr);

    // ========================================================================
    // Storage
    // ========================================================================

    /**
     * @brief Append "<n>: <message>" to the shared log ledger, n = entry count + 1.
     * @return false with NotFound if the log ledger does not exist
     */
    [[nodiscard]] bool Log(const std::string& message, Error* err = nullptr);

    /**
     * @brief Resolve the settings the host UI stored for this addon.
     *
     * Flat settings map label to value. Category settings map title to a
     * label/value object. Missing ledgers or blobs resolve to {}. A blob that
     * does not parse is skipped and reported through @p err.
     */
    [[nodiscard]] Json LoadSettingsData(Error* err = nullptr) const;

    /// @brief Resolve settings and emit them on OnSettingsChanged.
    [[nodiscard]] bool NotifySettingsChanged(const std::optional<Actor>& actor = std::nullopt,
                                             Error* err = nullptr);

    [[nodiscard]] FileSystem::DirectoryRegistry& Fs() noexcept { return m_fs; }

    [[nodiscard]] Signals::SignalHub& Events() noexcept { return m_hub; }

private:
    [[nodiscard]] bool OnEngineReady(Error* err);
    [[nodiscard]] bool OnCustomSignal(const std::string& id, const std::string& message, Error* err);
    [[nodiscard]] bool OnExtensionMessage(const std::string& id, const std::string& message, Error* err);

    [[nodiscard]] std::string SettingsLedgerName(const std::string* categoryTitle) const;
    [[nodiscard]] Json LoadSettingsObject(const std::string& ledgerName, Error* err) const;

    Ledger::ILedgerStore& m_store;
    IHostRuntime& m_host;
    Signals::SignalHub& m_hub;
    AddonOptions m_options;
    std::optional<AddonData> m_addonData;
    FileSystem::DirectoryRegistry m_fs;
};

} // namespace Addon
} // namespace AddonKit

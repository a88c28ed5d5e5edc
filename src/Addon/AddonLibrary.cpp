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
#include "AddonLibrary.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace AddonKit {
namespace Addon {

namespace {
    constexpr const char* LOG_CATEGORY = "AddonLibrary";
}

AddonLibrary::AddonLibrary(Ledger::ILedgerStore& store, IHostRuntime& host, Signals::SignalHub& hub,
                           AddonOptions options)
    : m_store(store)
    , m_host(host)
    , m_hub(hub)
    , m_options(std::move(options))
    , m_fs(store, [this]() { return Identifier(); }, m_options.fileSystem) {
}

// ============================================================================
// Identity
// ============================================================================

bool AddonLibrary::InitAddon(AddonData data, Error* err) {
    if (m_addonData) {
        return SetError(err, ErrorCode::AlreadyInitialized, "Addon already initialized");
    }

    m_addonData = std::move(data);
    AK_LOG_INFO(LOG_CATEGORY, "Initialized addon %s (version %s)",
        m_addonData->Identifier().c_str(), m_addonData->description.version.c_str());
    return true;
}

std::optional<std::string> AddonLibrary::Identifier() const {
    if (!m_addonData) {
        return std::nullopt;
    }
    return m_addonData->Identifier();
}

// ============================================================================
// Inbound messages
// ============================================================================

bool AddonLibrary::HandleHostMessage(const std::string& id, const std::string& message, Error* err) {
    if (id == Protocol::ENGINE_READY) {
        return OnEngineReady(err);
    }
    if (Utils::StringUtils::StartsWith(id, Protocol::SIGNAL_PREFIX)) {
        return OnCustomSignal(id, message, err);
    }
    if (Utils::StringUtils::StartsWith(id, Protocol::EXTENSION_PREFIX)) {
        return OnExtensionMessage(id, message, err);
    }

    AK_LOG_TRACE(LOG_CATEGORY, "Ignoring host message %s", id.c_str());
    return true;
}

bool AddonLibrary::OnEngineReady(Error* err) {
    if (!m_addonData) {
        return SetError(err, ErrorCode::Uninitialized, "addon data is undefined.");
    }

    m_host.SendBroadcast(Protocol::ADDON_READY, Utils::JSON::ToCompactString(m_addonData->ToJson()));
    m_hub.OnAddonReady.Emit(Signals::AddonReadyEvent{ *m_addonData });
    return true;
}

bool AddonLibrary::OnCustomSignal(const std::string& id, const std::string& message, Error* err) {
    // ACM:SIGNAL.<ADDON>.<EMITTER>; anything after a third '.' is ignored.
    const auto parts = Utils::StringUtils::Split(id, '.');
    if (parts.size() < 3) {
        AK_LOG_WARN(LOG_CATEGORY, "Dropping malformed signal id %s", id.c_str());
        return SetError(err, ErrorCode::InvalidArgument, "Malformed signal id: " + id);
    }

    Signals::CustomSignalEmittedEvent event;
    event.addonId = Utils::StringUtils::ToLowerAscii(parts[1]);
    event.emitterId = Utils::StringUtils::ToLowerAscii(parts[2]);

    if (message != Protocol::VOID_PAYLOAD) {
        Json data;
        Utils::JSON::Error parseErr;
        if (!Utils::JSON::Parse(message, data, &parseErr)) {
            AK_LOG_WARN(LOG_CATEGORY, "Dropping signal %s: payload is not JSON (%s)",
                id.c_str(), parseErr.message.c_str());
            return SetError(err, ErrorCode::ParseError, "Signal payload is not JSON: " + parseErr.message);
        }
        event.data = std::move(data);
    }

    m_hub.OnCustomSignalEmitted.Emit(event);
    return true;
}

bool AddonLibrary::OnExtensionMessage(const std::string& id, const std::string& message, Error* err) {
    if (!m_addonData) {
        return SetError(err, ErrorCode::Uninitialized, "addon data is undefined.");
    }

    const auto& extensions = m_addonData->extensions;
    if (!extensions || message.empty() || id != Protocol::EXTENSION_PREFIX + m_addonData->Identifier()) {
        return true;
    }

    Json payload;
    Utils::JSON::Error parseErr;
    if (!Utils::JSON::Parse(message, payload, &parseErr)) {
        AK_LOG_WARN(LOG_CATEGORY, "Dropping extension trigger: payload is not JSON (%s)",
            parseErr.message.c_str());
        return SetError(err, ErrorCode::ParseError, "Extension payload is not JSON: " + parseErr.message);
    }

    std::string playerId;
    std::string extensionId;
    if (!Utils::JSON::Get(payload, "playerId", playerId) ||
        !Utils::JSON::Get(payload, "extensionId", extensionId)) {
        AK_LOG_WARN(LOG_CATEGORY, "Dropping extension trigger: missing playerId or extensionId");
        return SetError(err, ErrorCode::InvalidArgument, "Extension payload needs playerId and extensionId");
    }

    bool declared = false;
    for (const auto& ext : *extensions) {
        if (ext.id.find(extensionId) != std::string::npos) {
            declared = true;
            break;
        }
    }
    if (!declared) {
        AK_LOG_DEBUG(LOG_CATEGORY, "Extension %s is not declared by %s",
            extensionId.c_str(), m_addonData->Identifier().c_str());
        return true;
    }

    auto actor = m_host.FindActor(playerId);
    if (!actor) {
        AK_LOG_DEBUG(LOG_CATEGORY, "Extension %s triggered by unknown actor %s",
            extensionId.c_str(), playerId.c_str());
        return true;
    }

    m_hub.OnExtensionTriggered.Emit(Signals::ExtensionTriggeredEvent{ extensionId, std::move(*actor) });
    return true;
}

// ============================================================================
// Outbound messages
// ============================================================================

bool AddonLibrary::Emit(const std::string& eventId, const std::optional<Json>& data, Error* err) {
    const auto identity = Identifier();
    if (!identity) {
        return SetError(err, ErrorCode::Uninitialized, "addon data is undefined.");
    }

    const std::string key = Utils::StringUtils::ToUpperAscii(
        std::string(Protocol::SIGNAL_PREFIX) + *identity + "." + eventId);

    std::string payload = Protocol::VOID_PAYLOAD;
    if (data && !data->is_null()) {
        payload = Utils::JSON::ToCompactString(*data);
    }

    m_host.SendBroadcast(key, payload);
    return true;
}

void AddonLibrary::ShowHomeForm(const Actor& actor) {
    m_host.SendBroadcast(Protocol::HUD_HOME, actor.id);
}

bool AddonLibrary::ShowAddonForm(const Actor& actor, Error* err) {
    if (!m_addonData) {
        return SetError(err, ErrorCode::Uninitialized, "addon data is undefined.");
    }

    Json request;
    request["playerId"] = actor.id;
    request["addonData"] = m_addonData->ToJson();
    m_host.SendBroadcast(Protocol::HUD_ADDON, Utils::JSON::ToCompactString(request));
    return true;
}

// ============================================================================
// Log ledger
// ============================================================================

bool AddonLibrary::Log(const std::string& message, Error* err) {
    Error lookupErr;
    auto ledger = m_store.GetNamed(m_options.logLedger, &lookupErr);
    if (!ledger) {
        if (lookupErr.HasError()) {
            if (err) *err = lookupErr;
            return false;
        }
        return SetError(err, ErrorCode::NotFound, "Log database not found");
    }

    Error listErr;
    const auto entries = ledger->ListEntries(&listErr);
    if (listErr.HasError()) {
        if (err) *err = listErr;
        return false;
    }

    const auto entry = static_cast<int64_t>(entries.size()) + 1;
    return ledger->SetEntry(std::to_string(entry) + ": " + message, entry, err);
}

// ============================================================================
// Settings
// ============================================================================

std::string AddonLibrary::SettingsLedgerName(const std::string* categoryTitle) const {
    std::string name = m_options.settingsPrefix + Utils::StringUtils::ToUpperAscii(m_addonData->Identifier());
    if (categoryTitle) {
        name += "_" + Utils::StringUtils::ToUpperAscii(*categoryTitle);
    }
    return name;
}

Json AddonLibrary::LoadSettingsObject(const std::string& ledgerName, Error* err) const {
    Json result = Json::object();

    auto ledger = m_store.GetNamed(ledgerName, err);
    if (!ledger) {
        return result;
    }

    // The host UI keeps the current blob in the first entry whose value is 0.
    const Ledger::LedgerEntry* blob = nullptr;
    const auto entries = ledger->ListEntries(err);
    for (const auto& entry : entries) {
        if (entry.value == 0) {
            blob = &entry;
            break;
        }
    }
    if (!blob) {
        return result;
    }

    Json raw;
    Utils::JSON::Error parseErr;
    WidgetList widgets;
    Error widgetErr;
    if (!Utils::JSON::Parse(blob->label, raw, &parseErr)) {
        AK_LOG_WARN(LOG_CATEGORY, "Settings in %s are not JSON: %s", ledgerName.c_str(), parseErr.message.c_str());
        SetError(err, ErrorCode::ParseError, "Settings in " + ledgerName + " are not JSON: " + parseErr.message);
        return result;
    }
    if (!WidgetListFromJson(raw, widgets, &widgetErr)) {
        AK_LOG_WARN(LOG_CATEGORY, "Settings in %s are invalid: %s", ledgerName.c_str(), widgetErr.message.c_str());
        SetError(err, ErrorCode::ParseError, widgetErr.message);
        return result;
    }

    for (const auto& widget : widgets) {
        result[GetWidgetLabel(widget)] = ResolveWidgetValue(widget);
    }
    return result;
}

Json AddonLibrary::LoadSettingsData(Error* err) const {
    if (!m_addonData) {
        return Json::object();
    }

    if (m_addonData->HasSettingsCategories()) {
        Json settings = Json::object();
        for (const auto& category : std::get<CategoryList>(*m_addonData->settings)) {
            settings[category.title] = LoadSettingsObject(SettingsLedgerName(&category.title), err);
        }
        return settings;
    }
    return LoadSettingsObject(SettingsLedgerName(nullptr), err);
}

bool AddonLibrary::NotifySettingsChanged(const std::optional<Actor>& actor, Error* err) {
    if (!m_addonData) {
        return SetError(err, ErrorCode::Uninitialized, "addon data is undefined.");
    }

    Error loadErr;
    Signals::SettingsChangedEvent event;
    event.settingsData = LoadSettingsData(&loadErr);
    event.actor = actor;
    if (loadErr.HasError()) {
        AK_LOG_WARN(LOG_CATEGORY, "Publishing partial settings for %s: %s",
            m_addonData->Identifier().c_str(), loadErr.message.c_str());
    }

    m_hub.OnSettingsChanged.Emit(event);
    return true;
}

} // namespace Addon
} // namespace AddonKit

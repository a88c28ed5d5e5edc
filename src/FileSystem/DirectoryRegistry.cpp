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
#include "DirectoryRegistry.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace AddonKit {
namespace FileSystem {

namespace {
    constexpr const char* LOG_CATEGORY = "DirectoryRegistry";
}

DirectoryRegistry::DirectoryRegistry(Ledger::ILedgerStore& store, IdentityProvider identity, RegistryOptions options)
    : m_store(store)
    , m_identity(std::move(identity))
    , m_options(std::move(options)) {
}

std::optional<std::string> DirectoryRegistry::OwnerId(Error* err) const {
    std::optional<std::string> identity;
    if (m_identity) {
        identity = m_identity();
    }
    if (!identity || identity->empty()) {
        SetError(err, ErrorCode::Uninitialized, "Addon data not found");
        return std::nullopt;
    }
    return Utils::StringUtils::ToUpperAscii(*identity);
}

std::optional<std::string> DirectoryRegistry::Format(const std::string& name, Error* err) const {
    const auto owner = OwnerId(err);
    if (!owner) {
        return std::nullopt;
    }
    return m_options.rootNamespace + "." + *owner + "." + Utils::StringUtils::ToUpperAscii(name);
}

bool DirectoryRegistry::IsValid(const std::string& name, Error* err) const {
    const auto ledgerName = Format(name, err);
    if (!ledgerName) {
        return false;
    }
    return m_store.GetNamed(*ledgerName, err) != nullptr;
}

std::optional<Directory> DirectoryRegistry::Get(const std::string& name, Error* err) const {
    const auto ledgerName = Format(name, err);
    if (!ledgerName) {
        return std::nullopt;
    }

    auto ledger = m_store.GetNamed(*ledgerName, err);
    if (!ledger) {
        return std::nullopt;
    }
    return Directory(std::move(ledger), *OwnerId(nullptr), m_options.directory);
}

std::optional<Directory> DirectoryRegistry::New(const std::string& name, bool ignoreWarn, Error* err) {
    const auto ledgerName = Format(name, err);
    if (!ledgerName) {
        return std::nullopt;
    }

    Error lookupErr;
    if (auto existing = Get(name, &lookupErr)) {
        if (!ignoreWarn) {
            AK_LOG_WARN(LOG_CATEGORY, "Directory %s already exists", ledgerName->c_str());
        }
        return existing;
    }
    if (lookupErr.HasError()) {
        if (err) *err = lookupErr;
        return std::nullopt;
    }

    auto ledger = m_store.CreateNamed(*ledgerName, err);
    if (!ledger) {
        return std::nullopt;
    }
    AK_LOG_DEBUG(LOG_CATEGORY, "Created directory %s", ledgerName->c_str());
    return Directory(std::move(ledger), *OwnerId(nullptr), m_options.directory);
}

bool DirectoryRegistry::Delete(const std::string& name, Error* err) {
    Error lookupErr;
    const auto directory = Get(name, &lookupErr);
    if (!directory) {
        if (lookupErr.HasError()) {
            if (err) *err = lookupErr;
            return false;
        }
        return SetError(err, ErrorCode::NotFound, "Directory " + name + " does not exist");
    }

    const auto ledgerName = Format(name, err);
    if (!ledgerName) {
        return false;
    }
    return m_store.DeleteNamed(*ledgerName, err);
}

} // namespace FileSystem
} // namespace AddonKit

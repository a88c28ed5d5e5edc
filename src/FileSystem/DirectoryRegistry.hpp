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
 * @file DirectoryRegistry.hpp
 * @brief Creates, resolves and deletes Directories by logical name.
 *
 * Ledger names are derived deterministically:
 *
 *   Format("logs") == "<ROOT>.<AUTHOR_PACKID>.LOGS"
 *
 * with the addon identity and the directory name upper-cased. Every
 * operation needs the addon identity and fails with Uninitialized until the
 * identity provider returns one.
 */

#include "Directory.hpp"

#include <functional>

namespace AddonKit {
namespace FileSystem {

/// @brief Returns the addon identity ("<author>_<packId>") once it is known.
using IdentityProvider = std::function<std::optional<std::string>()>;

inline constexpr const char* DEFAULT_ROOT_NAMESPACE = "ACM:FS";

struct RegistryOptions {
    std::string rootNamespace = DEFAULT_ROOT_NAMESPACE;
    DirectoryOptions directory;
};

class DirectoryRegistry {
public:
    DirectoryRegistry(Ledger::ILedgerStore& store, IdentityProvider identity, RegistryOptions options = {});

    /**
     * @brief Canonical ledger name for @p name.
     * @return nullopt with Uninitialized if the addon identity is not known yet
     */
    [[nodiscard]] std::optional<std::string> Format(const std::string& name, Error* err = nullptr) const;

    /// @brief True iff the backing ledger exists.
    [[nodiscard]] bool IsValid(const std::string& name, Error* err = nullptr) const;

    /// @brief Resolve without creating. nullopt with a clear @p err means absent.
    [[nodiscard]] std::optional<Directory> Get(const std::string& name, Error* err = nullptr) const;

    /**
     * @brief Return the existing directory, or create its ledger.
     * @param ignoreWarn Suppress the "already exists" warning
     */
    [[nodiscard]] std::optional<Directory> New(const std::string& name, bool ignoreWarn = false,
                                               Error* err = nullptr);

    /// @brief Remove the backing ledger. NotFound if the directory does not exist.
    [[nodiscard]] bool Delete(const std::string& name, Error* err = nullptr);

    [[nodiscard]] const RegistryOptions& GetOptions() const noexcept { return m_options; }

private:
    [[nodiscard]] std::optional<std::string> OwnerId(Error* err) const;

    Ledger::ILedgerStore& m_store;
    IdentityProvider m_identity;
    RegistryOptions m_options;
};

} // namespace FileSystem
} // namespace AddonKit

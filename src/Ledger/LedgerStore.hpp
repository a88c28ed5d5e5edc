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
 * AddonKit Ledger Store - HEADER
 * ============================================================================
 *
 * @file LedgerStore.hpp
 * @brief Abstract named-ledger primitive provided by the host runtime.
 *
 * A named ledger is an ordered collection of entries, each a display label
 * paired with an integer. This is the only persistence primitive available to
 * addons; everything else (directories, settings, the addon log) is encoded
 * on top of it.
 *
 * Architecture Position:
 * ----------------------
 *   ┌─────────────────────────────────────────────────────────────┐
 *   │        Directory / DirectoryRegistry / AddonLibrary          │
 *   └─────────────────────────────────────────────────────────────┘
 *                                 │
 *                                 ▼
 *   ┌─────────────────────────────────────────────────────────────┐
 *   │                 ILedgerStore / ILedger                       │ ◄── YOU ARE HERE
 *   └─────────────────────────────────────────────────────────────┘
 *                 │                               │
 *                 ▼                               ▼
 *   ┌──────────────────────────┐   ┌──────────────────────────────┐
 *   │    MemoryLedgerStore     │   │  SqliteLedgerStore (SQLiteCpp) │
 *   └──────────────────────────┘   └──────────────────────────────┘
 *
 * Semantics shared by every backing:
 * - SetEntry on an existing label updates its integer, otherwise appends.
 * - There is no entry-level locking and no atomic "count then insert".
 * - Entry order is backing-defined; callers must not assume sorting.
 *
 * Thread Safety:
 * --------------
 * None. The host runtime is single-threaded and cooperative.
 */

#include "../Core/Error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace AddonKit {
namespace Ledger {

/**
 * @brief One ledger entry: a display label and its integer value.
 */
struct LedgerEntry {
    std::string label;
    int64_t value = 0;

    bool operator==(const LedgerEntry& other) const noexcept {
        return label == other.label && value == other.value;
    }
};

/**
 * @brief Handle to one named ledger.
 *
 * A handle outlives deletion of its ledger; after deletion every mutation
 * fails with NotFound and ListEntries returns nothing.
 */
class ILedger {
public:
    virtual ~ILedger() = default;

    [[nodiscard]] virtual const std::string& Name() const noexcept = 0;

    [[nodiscard]] virtual std::vector<LedgerEntry> ListEntries(Error* err = nullptr) const = 0;

    /**
     * @brief Insert or update the entry identified by @p label.
     */
    [[nodiscard]] virtual bool SetEntry(const std::string& label, int64_t value, Error* err = nullptr) = 0;

    /**
     * @brief Remove the entry identified by @p label. NotFound if absent.
     */
    [[nodiscard]] virtual bool RemoveEntry(const std::string& label, Error* err = nullptr) = 0;
};

/**
 * @brief Host-wide namespace of named ledgers.
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Create a ledger. AlreadyExists if the name is taken.
     */
    [[nodiscard]] virtual std::shared_ptr<ILedger> CreateNamed(const std::string& name, Error* err = nullptr) = 0;

    /**
     * @brief Resolve a ledger without creating it.
     * @return nullptr if absent (err stays clear) or on storage failure (err filled)
     */
    [[nodiscard]] virtual std::shared_ptr<ILedger> GetNamed(const std::string& name, Error* err = nullptr) = 0;

    /**
     * @brief Delete a ledger and all of its entries. NotFound if absent.
     */
    [[nodiscard]] virtual bool DeleteNamed(const std::string& name, Error* err = nullptr) = 0;

    [[nodiscard]] virtual std::vector<std::string> ListNames(Error* err = nullptr) const = 0;
};

} // namespace Ledger
} // namespace AddonKit

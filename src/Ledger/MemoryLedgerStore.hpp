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
 * @file MemoryLedgerStore.hpp
 * @brief In-process ledger backing. Entries keep insertion order.
 */

#include "LedgerStore.hpp"

#include <map>

namespace AddonKit {
namespace Ledger {

class MemoryLedger final : public ILedger {
public:
    explicit MemoryLedger(std::string name);

    [[nodiscard]] const std::string& Name() const noexcept override { return m_name; }
    [[nodiscard]] std::vector<LedgerEntry> ListEntries(Error* err = nullptr) const override;
    [[nodiscard]] bool SetEntry(const std::string& label, int64_t value, Error* err = nullptr) override;
    [[nodiscard]] bool RemoveEntry(const std::string& label, Error* err = nullptr) override;

    /// @brief Called by the store when the ledger is deleted.
    void Invalidate() noexcept;

private:
    std::string m_name;
    std::vector<LedgerEntry> m_entries;
    bool m_valid = true;
};

class MemoryLedgerStore final : public ILedgerStore {
public:
    MemoryLedgerStore() = default;
    ~MemoryLedgerStore() override;

    MemoryLedgerStore(const MemoryLedgerStore&) = delete;
    MemoryLedgerStore& operator=(const MemoryLedgerStore&) = delete;

    [[nodiscard]] std::shared_ptr<ILedger> CreateNamed(const std::string& name, Error* err = nullptr) override;
    [[nodiscard]] std::shared_ptr<ILedger> GetNamed(const std::string& name, Error* err = nullptr) override;
    [[nodiscard]] bool DeleteNamed(const std::string& name, Error* err = nullptr) override;
    [[nodiscard]] std::vector<std::string> ListNames(Error* err = nullptr) const override;

private:
    std::map<std::string, std::shared_ptr<MemoryLedger>> m_ledgers;
};

} // namespace Ledger
} // namespace AddonKit

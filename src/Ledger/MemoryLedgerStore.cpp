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
#include "MemoryLedgerStore.hpp"

#include <algorithm>

namespace AddonKit {
namespace Ledger {

// ============================================================================
// MemoryLedger
// ============================================================================

MemoryLedger::MemoryLedger(std::string name)
    : m_name(std::move(name)) {
}

std::vector<LedgerEntry> MemoryLedger::ListEntries(Error* /*err*/) const {
    if (!m_valid) return {};
    return m_entries;
}

bool MemoryLedger::SetEntry(const std::string& label, int64_t value, Error* err) {
    if (!m_valid) {
        return SetError(err, ErrorCode::NotFound, "Ledger " + m_name + " was deleted");
    }

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&label](const LedgerEntry& e) { return e.label == label; });
    if (it != m_entries.end()) {
        it->value = value;
    } else {
        m_entries.push_back(LedgerEntry{label, value});
    }
    return true;
}

bool MemoryLedger::RemoveEntry(const std::string& label, Error* err) {
    if (!m_valid) {
        return SetError(err, ErrorCode::NotFound, "Ledger " + m_name + " was deleted");
    }

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&label](const LedgerEntry& e) { return e.label == label; });
    if (it == m_entries.end()) {
        return SetError(err, ErrorCode::NotFound, "Entry " + label + " not in ledger " + m_name);
    }
    m_entries.erase(it);
    return true;
}

void MemoryLedger::Invalidate() noexcept {
    m_valid = false;
    m_entries.clear();
}

// ============================================================================
// MemoryLedgerStore
// ============================================================================

MemoryLedgerStore::~MemoryLedgerStore() {
    for (auto& [name, ledger] : m_ledgers) {
        ledger->Invalidate();
    }
}

std::shared_ptr<ILedger> MemoryLedgerStore::CreateNamed(const std::string& name, Error* err) {
    if (name.empty()) {
        SetError(err, ErrorCode::InvalidArgument, "Ledger name is empty");
        return nullptr;
    }
    if (m_ledgers.count(name) != 0) {
        SetError(err, ErrorCode::AlreadyExists, "Ledger " + name + " already exists");
        return nullptr;
    }

    auto ledger = std::make_shared<MemoryLedger>(name);
    m_ledgers.emplace(name, ledger);
    return ledger;
}

std::shared_ptr<ILedger> MemoryLedgerStore::GetNamed(const std::string& name, Error* /*err*/) {
    auto it = m_ledgers.find(name);
    if (it == m_ledgers.end()) return nullptr;
    return it->second;
}

bool MemoryLedgerStore::DeleteNamed(const std::string& name, Error* err) {
    auto it = m_ledgers.find(name);
    if (it == m_ledgers.end()) {
        return SetError(err, ErrorCode::NotFound, "Ledger " + name + " does not exist");
    }
    it->second->Invalidate();
    m_ledgers.erase(it);
    return true;
}

std::vector<std::string> MemoryLedgerStore::ListNames(Error* /*err*/) const {
    std::vector<std::string> names;
    names.reserve(m_ledgers.size());
    for (const auto& [name, ledger] : m_ledgers) {
        names.push_back(name);
    }
    return names;
}

} // namespace Ledger
} // namespace AddonKit

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
 * AddonKit SqliteLedgerStore - HEADER
 * ============================================================================
 *
 * @file SqliteLedgerStore.hpp
 * @brief SQLite-backed ledger store for hosts that persist ledgers to disk.
 *
 * Schema:
 * -------
 *   ledgers(name TEXT PRIMARY KEY)
 *   ledger_entries(ledger TEXT, label TEXT, value INTEGER,
 *                  UNIQUE(ledger, label), FOREIGN KEY(ledger) ON DELETE CASCADE)
 *
 * Entries are listed in rowid order. An upsert keeps the original rowid, so
 * updating a label's integer does not move it.
 *
 * Usage Example:
 * --------------
 * @code
 * SqliteLedgerConfig cfg;
 * cfg.databasePath = "ledgers.db";
 * Error err;
 * auto store = SqliteLedgerStore::Open(cfg, &err);
 * if (!store) { ... err.message ... }
 * auto ledger = store->CreateNamed("ACM:LOG");
 * @endcode
 */

#include "LedgerStore.hpp"

#include <string_view>

namespace SQLite {
class Database;
}

namespace AddonKit {
namespace Ledger {

/**
 * @brief Connection settings for the SQLite backing.
 */
struct SqliteLedgerConfig {
    std::string databasePath = ":memory:";  ///< File path or ":memory:"
    int busyTimeoutMs = 2000;               ///< sqlite busy handler timeout
    std::string journalMode = "DELETE";     ///< PRAGMA journal_mode
    std::string synchronousMode = "NORMAL"; ///< PRAGMA synchronous
};

/// journal_mode keyword check (DELETE, TRUNCATE, PERSIST, MEMORY, WAL, OFF), any case.
[[nodiscard]] bool IsValidJournalMode(std::string_view mode);

/// synchronous keyword check (OFF, NORMAL, FULL, EXTRA), any case.
[[nodiscard]] bool IsValidSynchronousMode(std::string_view mode);

class SqliteLedger final : public ILedger {
public:
    SqliteLedger(std::shared_ptr<SQLite::Database> db, std::string name);

    [[nodiscard]] const std::string& Name() const noexcept override { return m_name; }
    [[nodiscard]] std::vector<LedgerEntry> ListEntries(Error* err = nullptr) const override;
    [[nodiscard]] bool SetEntry(const std::string& label, int64_t value, Error* err = nullptr) override;
    [[nodiscard]] bool RemoveEntry(const std::string& label, Error* err = nullptr) override;

private:
    [[nodiscard]] bool LedgerExists() const;

    std::shared_ptr<SQLite::Database> m_db;
    std::string m_name;
};

class SqliteLedgerStore final : public ILedgerStore {
public:
    /**
     * @brief Open (or create) the database and apply the schema.
     *
     * An unknown journal or synchronous mode fails with InvalidArgument
     * before the database is touched.
     * @return nullptr on failure with @p err filled
     */
    [[nodiscard]] static std::unique_ptr<SqliteLedgerStore> Open(const SqliteLedgerConfig& config,
                                                                 Error* err = nullptr);

    ~SqliteLedgerStore() override;

    SqliteLedgerStore(const SqliteLedgerStore&) = delete;
    SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;

    [[nodiscard]] std::shared_ptr<ILedger> CreateNamed(const std::string& name, Error* err = nullptr) override;
    [[nodiscard]] std::shared_ptr<ILedger> GetNamed(const std::string& name, Error* err = nullptr) override;
    [[nodiscard]] bool DeleteNamed(const std::string& name, Error* err = nullptr) override;
    [[nodiscard]] std::vector<std::string> ListNames(Error* err = nullptr) const override;

    [[nodiscard]] const SqliteLedgerConfig& GetConfig() const noexcept { return m_config; }

private:
    SqliteLedgerStore(SqliteLedgerConfig config, std::shared_ptr<SQLite::Database> db);

    SqliteLedgerConfig m_config;
    std::shared_ptr<SQLite::Database> m_db;
};

} // namespace Ledger
} // namespace AddonKit

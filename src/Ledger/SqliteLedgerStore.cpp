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
#include "SqliteLedgerStore.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <array>

#include <SQLiteCpp/SQLiteCpp.h>

namespace AddonKit {
namespace Ledger {

namespace {
    constexpr const char* LOG_CATEGORY = "SqliteLedger";

    constexpr const char* SCHEMA_SQL =
        "CREATE TABLE IF NOT EXISTS ledgers ("
        "  name TEXT PRIMARY KEY NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS ledger_entries ("
        "  ledger TEXT NOT NULL REFERENCES ledgers(name) ON DELETE CASCADE,"
        "  label  TEXT NOT NULL,"
        "  value  INTEGER NOT NULL,"
        "  UNIQUE(ledger, label)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_ledger_entries_ledger ON ledger_entries(ledger);";

    constexpr std::array<std::string_view, 6> JOURNAL_MODES = {
        "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"
    };
    constexpr std::array<std::string_view, 4> SYNCHRONOUS_MODES = {
        "OFF", "NORMAL", "FULL", "EXTRA"
    };

    template <size_t N>
    bool IsKeyword(const std::array<std::string_view, N>& keywords, std::string_view value) {
        const std::string upper = Utils::StringUtils::ToUpperAscii(value);
        return std::find(keywords.begin(), keywords.end(), upper) != keywords.end();
    }

    bool StorageFailure(Error* err, const char* context, const SQLite::Exception& ex) {
        AK_LOG_ERROR(LOG_CATEGORY, "%s failed: %s (code %d)", context, ex.what(), ex.getErrorCode());
        return SetError(err, ErrorCode::StorageError, std::string(context) + ": " + ex.what());
    }
}

// ============================================================================
// SqliteLedger
// ============================================================================

SqliteLedger::SqliteLedger(std::shared_ptr<SQLite::Database> db, std::string name)
    : m_db(std::move(db))
    , m_name(std::move(name)) {
}

bool SqliteLedger::LedgerExists() const {
    SQLite::Statement query(*m_db, "SELECT 1 FROM ledgers WHERE name = ?");
    query.bind(1, m_name);
    return query.executeStep();
}

std::vector<LedgerEntry> SqliteLedger::ListEntries(Error* err) const {
    std::vector<LedgerEntry> entries;
    try {
        SQLite::Statement query(*m_db,
            "SELECT label, value FROM ledger_entries WHERE ledger = ? ORDER BY rowid");
        query.bind(1, m_name);
        while (query.executeStep()) {
            LedgerEntry entry;
            entry.label = query.getColumn(0).getString();
            entry.value = query.getColumn(1).getInt64();
            entries.push_back(std::move(entry));
        }
    }
    catch (const SQLite::Exception& ex) {
        StorageFailure(err, "ListEntries", ex);
        entries.clear();
    }
    return entries;
}

bool SqliteLedger::SetEntry(const std::string& label, int64_t value, Error* err) {
    try {
        if (!LedgerExists()) {
            return SetError(err, ErrorCode::NotFound, "Ledger " + m_name + " was deleted");
        }

        SQLite::Statement upsert(*m_db,
            "INSERT INTO ledger_entries(ledger, label, value) VALUES(?, ?, ?) "
            "ON CONFLICT(ledger, label) DO UPDATE SET value = excluded.value");
        upsert.bind(1, m_name);
        upsert.bind(2, label);
        upsert.bind(3, value);
        upsert.exec();
        return true;
    }
    catch (const SQLite::Exception& ex) {
        return StorageFailure(err, "SetEntry", ex);
    }
}

bool SqliteLedger::RemoveEntry(const std::string& label, Error* err) {
    try {
        if (!LedgerExists()) {
            return SetError(err, ErrorCode::NotFound, "Ledger " + m_name + " was deleted");
        }

        SQLite::Statement del(*m_db, "DELETE FROM ledger_entries WHERE ledger = ? AND label = ?");
        del.bind(1, m_name);
        del.bind(2, label);
        if (del.exec() == 0) {
            return SetError(err, ErrorCode::NotFound, "Entry " + label + " not in ledger " + m_name);
        }
        return true;
    }
    catch (const SQLite::Exception& ex) {
        return StorageFailure(err, "RemoveEntry", ex);
    }
}

bool IsValidJournalMode(std::string_view mode) {
    return IsKeyword(JOURNAL_MODES, mode);
}

bool IsValidSynchronousMode(std::string_view mode) {
    return IsKeyword(SYNCHRONOUS_MODES, mode);
}

// ============================================================================
// SqliteLedgerStore
// ============================================================================

SqliteLedgerStore::SqliteLedgerStore(SqliteLedgerConfig config, std::shared_ptr<SQLite::Database> db)
    : m_config(std::move(config))
    , m_db(std::move(db)) {
}

SqliteLedgerStore::~SqliteLedgerStore() = default;

std::unique_ptr<SqliteLedgerStore> SqliteLedgerStore::Open(const SqliteLedgerConfig& config, Error* err) {
    // Both modes are pasted into PRAGMA text, so only known keywords pass.
    if (!IsValidJournalMode(config.journalMode)) {
        SetError(err, ErrorCode::InvalidArgument, "Unknown journal mode '" + config.journalMode + "'");
        return nullptr;
    }
    if (!IsValidSynchronousMode(config.synchronousMode)) {
        SetError(err, ErrorCode::InvalidArgument, "Unknown synchronous mode '" + config.synchronousMode + "'");
        return nullptr;
    }

    try {
        auto db = std::make_shared<SQLite::Database>(
            config.databasePath,
            SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE,
            config.busyTimeoutMs);

        db->exec("PRAGMA foreign_keys = ON");
        db->exec("PRAGMA journal_mode = " + config.journalMode);
        db->exec("PRAGMA synchronous = " + config.synchronousMode);
        db->exec(SCHEMA_SQL);

        AK_LOG_INFO(LOG_CATEGORY, "Opened ledger database %s", config.databasePath.c_str());
        return std::unique_ptr<SqliteLedgerStore>(new SqliteLedgerStore(config, std::move(db)));
    }
    catch (const SQLite::Exception& ex) {
        StorageFailure(err, "Open", ex);
        return nullptr;
    }
}

std::shared_ptr<ILedger> SqliteLedgerStore::CreateNamed(const std::string& name, Error* err) {
    if (name.empty()) {
        SetError(err, ErrorCode::InvalidArgument, "Ledger name is empty");
        return nullptr;
    }

    try {
        SQLite::Statement insert(*m_db, "INSERT OR IGNORE INTO ledgers(name) VALUES(?)");
        insert.bind(1, name);
        if (insert.exec() == 0) {
            SetError(err, ErrorCode::AlreadyExists, "Ledger " + name + " already exists");
            return nullptr;
        }
        AK_LOG_DEBUG(LOG_CATEGORY, "Created ledger %s", name.c_str());
        return std::make_shared<SqliteLedger>(m_db, name);
    }
    catch (const SQLite::Exception& ex) {
        StorageFailure(err, "CreateNamed", ex);
        return nullptr;
    }
}

std::shared_ptr<ILedger> SqliteLedgerStore::GetNamed(const std::string& name, Error* err) {
    try {
        SQLite::Statement query(*m_db, "SELECT 1 FROM ledgers WHERE name = ?");
        query.bind(1, name);
        if (!query.executeStep()) {
            return nullptr;
        }
        return std::make_shared<SqliteLedger>(m_db, name);
    }
    catch (const SQLite::Exception& ex) {
        StorageFailure(err, "GetNamed", ex);
        return nullptr;
    }
}

bool SqliteLedgerStore::DeleteNamed(const std::string& name, Error* err) {
    try {
        SQLite::Statement del(*m_db, "DELETE FROM ledgers WHERE name = ?");
        del.bind(1, name);
        if (del.exec() == 0) {
            return SetError(err, ErrorCode::NotFound, "Ledger " + name + " does not exist");
        }
        AK_LOG_DEBUG(LOG_CATEGORY, "Deleted ledger %s", name.c_str());
        return true;
    }
    catch (const SQLite::Exception& ex) {
        return StorageFailure(err, "DeleteNamed", ex);
    }
}

std::vector<std::string> SqliteLedgerStore::ListNames(Error* err) const {
    std::vector<std::string> names;
    try {
        SQLite::Statement query(*m_db, "SELECT name FROM ledgers ORDER BY name");
        while (query.executeStep()) {
            names.push_back(query.getColumn(0).getString());
        }
    }
    catch (const SQLite::Exception& ex) {
        StorageFailure(err, "ListNames", ex);
        names.clear();
    }
    return names;
}

} // namespace Ledger
} // namespace AddonKit

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
#include "LedgerStoreFactory.hpp"
#include "MemoryLedgerStore.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <string>

namespace AddonKit {
namespace Ledger {

namespace {
    constexpr const char* LOG_CATEGORY = "LedgerStore";
}

std::string_view GetLedgerBackendName(LedgerBackend backend) noexcept {
    switch (backend) {
        case LedgerBackend::Memory: return "memory";
        case LedgerBackend::Sqlite: return "sqlite";
    }
    return "unknown";
}

bool ParseLedgerBackend(std::string_view name, LedgerBackend& out) {
    const std::string lower = Utils::StringUtils::ToLowerAscii(name);
    if (lower == "memory") {
        out = LedgerBackend::Memory;
        return true;
    }
    if (lower == "sqlite") {
        out = LedgerBackend::Sqlite;
        return true;
    }
    return false;
}

std::unique_ptr<ILedgerStore> CreateLedgerStore(const LedgerConfig& config, Error* err) {
    AK_LOG_INFO(LOG_CATEGORY, "Creating %s ledger store",
        std::string(GetLedgerBackendName(config.backend)).c_str());

    switch (config.backend) {
        case LedgerBackend::Memory:
            return std::make_unique<MemoryLedgerStore>();
        case LedgerBackend::Sqlite:
            return SqliteLedgerStore::Open(config.sqlite, err);
    }

    SetError(err, ErrorCode::InvalidArgument, "Unknown ledger backend");
    return nullptr;
}

} // namespace Ledger
} // namespace AddonKit

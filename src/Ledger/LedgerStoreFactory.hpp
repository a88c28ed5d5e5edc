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
 * @file LedgerStoreFactory.hpp
 * @brief Builds the configured ledger backing.
 */

#include "LedgerStore.hpp"
#include "SqliteLedgerStore.hpp"

#include <string_view>

namespace AddonKit {
namespace Ledger {

enum class LedgerBackend : uint8_t {
    Memory,
    Sqlite
};

[[nodiscard]] std::string_view GetLedgerBackendName(LedgerBackend backend) noexcept;

/// @brief Parse "memory" / "sqlite" (case-insensitive).
[[nodiscard]] bool ParseLedgerBackend(std::string_view name, LedgerBackend& out);

struct LedgerConfig {
    LedgerBackend backend = LedgerBackend::Memory;
    SqliteLedgerConfig sqlite;
};

/**
 * @brief Create the store described by @p config.
 * @return nullptr with @p err filled if the backing cannot be opened
 */
[[nodiscard]] std::unique_ptr<ILedgerStore> CreateLedgerStore(const LedgerConfig& config, Error* err = nullptr);

} // namespace Ledger
} // namespace AddonKit

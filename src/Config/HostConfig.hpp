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
 * AddonKit HostConfig - HEADER
 * ============================================================================
 *
 * @file HostConfig.hpp
 * @brief Runtime configuration for a host embedding AddonKit.
 *
 * File format (every key optional):
 * ---------------------------------
 * @code
 * {
 *   "logging":    { "minLevel": "info", "toConsole": true, "toFile": false,
 *                   "logDirectory": "logs", "baseFileName": "addonkit",
 *                   "jsonLines": false, "async": false,
 *                   "maxFileSizeBytes": 10485760, "maxFileCount": 5 },
 *   "ledger":     { "backend": "sqlite", "path": "ledgers.db", "busyTimeoutMs": 2000,
 *                   "journalMode": "WAL", "synchronousMode": "NORMAL" },
 *   "filesystem": { "rootNamespace": "ACM:FS", "strictOwnership": false },
 *   "addon":      { "logLedger": "ACM:LOG", "settingsPrefix": "ACM:" }
 * }
 * @endcode
 *
 * Missing keys keep their defaults. A key of the wrong type, or an unknown
 * level or backend name, fails the whole load with InvalidArgument.
 */

#include "../Addon/AddonLibrary.hpp"
#include "../Core/Error.hpp"
#include "../Ledger/LedgerStoreFactory.hpp"
#include "../Utils/Logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace AddonKit {
namespace Config {

namespace ConfigConstants {
    /// @brief Conventional configuration file name
    inline constexpr const char* CONFIG_FILE_NAME = "addonkit.json";
}

struct HostConfig {
    Utils::LoggerConfig logging;
    Ledger::LedgerConfig ledger;
    Addon::AddonOptions addon;
};

/**
 * @brief Apply the sections present in @p j on top of @p out.
 * @return false with InvalidArgument; @p out is left unchanged on failure
 */
[[nodiscard]] bool ParseHostConfig(const nlohmann::json& j, HostConfig& out, Error* err = nullptr);

/**
 * @brief Load and parse a configuration file.
 * @return false with NotFound, ParseError or InvalidArgument
 */
[[nodiscard]] bool LoadHostConfig(const std::filesystem::path& path, HostConfig& out, Error* err = nullptr);

/// @brief Serialize every setting, defaults included.
[[nodiscard]] nlohmann::json HostConfigToJson(const HostConfig& config);

} // namespace Config
} // namespace AddonKit

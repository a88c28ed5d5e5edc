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
#include "HostConfig.hpp"
#include "../Utils/JSONUtils.hpp"

#include <cstdint>
#include <limits>
#include <system_error>

namespace AddonKit {
namespace Config {

namespace {
    constexpr const char* LOG_CATEGORY = "HostConfig";

    using Json = nlohmann::json;

    /**
     * @brief Reads optional members of one section, remembering the first failure.
     */
    class SectionReader {
    public:
        SectionReader(const Json& root, const char* section, Error* err)
            : m_section(section)
            , m_err(err) {
            const auto it = root.find(section);
            if (it == root.end() || it->is_null()) {
                return;
            }
            if (!it->is_object()) {
                Fail(std::string("section '") + section + "' must be an object");
                return;
            }
            m_node = &*it;
        }

        [[nodiscard]] bool Ok() const noexcept { return m_ok; }

        void ReadBool(const char* key, bool& out) {
            if (const Json* v = Find(key)) {
                if (!v->is_boolean()) { Fail(Key(key) + " must be a boolean"); return; }
                out = v->get<bool>();
            }
        }

        void ReadString(const char* key, std::string& out) {
            if (const Json* v = Find(key)) {
                if (!v->is_string()) { Fail(Key(key) + " must be a string"); return; }
                out = v->get<std::string>();
            }
        }

        template <typename T>
        void ReadUnsigned(const char* key, T& out) {
            if (const Json* v = Find(key)) {
                // Values written from a signed C++ field come back as number_integer.
                const bool nonNegative = v->is_number_unsigned() ||
                    (v->is_number_integer() && v->get<int64_t>() >= 0);
                if (!nonNegative) { Fail(Key(key) + " must be a non-negative integer"); return; }
                const uint64_t value = v->get<uint64_t>();
                if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                    Fail(Key(key) + " is out of range");
                    return;
                }
                out = static_cast<T>(value);
            }
        }

        void ReadLogLevel(const char* key, Utils::LogLevel& out) {
            std::string name;
            if (!Find(key)) {
                return;
            }
            ReadString(key, name);
            if (m_ok && !Utils::ParseLogLevel(name, out)) {
                Fail(Key(key) + ": unknown log level '" + name + "'");
            }
        }

        void ReadBackend(const char* key, Ledger::LedgerBackend& out) {
            std::string name;
            if (!Find(key)) {
                return;
            }
            ReadString(key, name);
            if (m_ok && !Ledger::ParseLedgerBackend(name, out)) {
                Fail(Key(key) + ": unknown ledger backend '" + name + "'");
            }
        }

    private:
        const Json* Find(const char* key) const {
            if (!m_ok || !m_node) {
                return nullptr;
            }
            const auto it = m_node->find(key);
            if (it == m_node->end() || it->is_null()) {
                return nullptr;
            }
            return &*it;
        }

        std::string Key(const char* key) const {
            return std::string(m_section) + "." + key;
        }

        void Fail(const std::string& message) {
            if (m_ok) {
                m_ok = false;
                SetError(m_err, ErrorCode::InvalidArgument, message);
            }
        }

        const char* m_section;
        Error* m_err;
        const Json* m_node = nullptr;
        bool m_ok = true;
    };
}

bool ParseHostConfig(const Json& j, HostConfig& out, Error* err) {
    if (!j.is_object()) {
        return SetError(err, ErrorCode::InvalidArgument, "configuration root must be an object");
    }

    HostConfig cfg = out;

    SectionReader logging(j, "logging", err);
    logging.ReadLogLevel("minLevel", cfg.logging.minimalLevel);
    logging.ReadBool("toConsole", cfg.logging.toConsole);
    logging.ReadBool("toFile", cfg.logging.toFile);
    logging.ReadString("logDirectory", cfg.logging.logDirectory);
    logging.ReadString("baseFileName", cfg.logging.baseFileName);
    logging.ReadBool("jsonLines", cfg.logging.jsonLines);
    logging.ReadBool("async", cfg.logging.async);
    logging.ReadUnsigned("maxFileSizeBytes", cfg.logging.maxFileSizeBytes);
    logging.ReadUnsigned("maxFileCount", cfg.logging.maxFileCount);
    if (!logging.Ok()) {
        return false;
    }

    SectionReader ledger(j, "ledger", err);
    ledger.ReadBackend("backend", cfg.ledger.backend);
    ledger.ReadString("path", cfg.ledger.sqlite.databasePath);
    ledger.ReadUnsigned("busyTimeoutMs", cfg.ledger.sqlite.busyTimeoutMs);
    ledger.ReadString("journalMode", cfg.ledger.sqlite.journalMode);
    ledger.ReadString("synchronousMode", cfg.ledger.sqlite.synchronousMode);
    if (!ledger.Ok()) {
        return false;
    }

    SectionReader filesystem(j, "filesystem", err);
    filesystem.ReadString("rootNamespace", cfg.addon.fileSystem.rootNamespace);
    filesystem.ReadBool("strictOwnership", cfg.addon.fileSystem.directory.strictOwnership);
    if (!filesystem.Ok()) {
        return false;
    }

    SectionReader addon(j, "addon", err);
    addon.ReadString("logLedger", cfg.addon.logLedger);
    addon.ReadString("settingsPrefix", cfg.addon.settingsPrefix);
    if (!addon.Ok()) {
        return false;
    }

    if (cfg.addon.fileSystem.rootNamespace.empty()) {
        return SetError(err, ErrorCode::InvalidArgument, "filesystem.rootNamespace must not be empty");
    }
    if (cfg.ledger.backend == Ledger::LedgerBackend::Sqlite && cfg.ledger.sqlite.databasePath.empty()) {
        return SetError(err, ErrorCode::InvalidArgument, "ledger.path is required for the sqlite backend");
    }
    if (!Ledger::IsValidJournalMode(cfg.ledger.sqlite.journalMode)) {
        return SetError(err, ErrorCode::InvalidArgument,
            "ledger.journalMode: unknown journal mode '" + cfg.ledger.sqlite.journalMode + "'");
    }
    if (!Ledger::IsValidSynchronousMode(cfg.ledger.sqlite.synchronousMode)) {
        return SetError(err, ErrorCode::InvalidArgument,
            "ledger.synchronousMode: unknown synchronous mode '" + cfg.ledger.sqlite.synchronousMode + "'");
    }

    out = std::move(cfg);
    return true;
}

bool LoadHostConfig(const std::filesystem::path& path, HostConfig& out, Error* err) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return SetError(err, ErrorCode::NotFound, "Configuration file not found: " + path.string());
    }

    Json j;
    Utils::JSON::Error jsonErr;
    Utils::JSON::ParseOptions opts;
    opts.allowComments = true;
    if (!Utils::JSON::LoadFromFile(path, j, &jsonErr, opts)) {
        AK_LOG_ERROR(LOG_CATEGORY, "Cannot load %s: %s (line %zu, column %zu)",
            path.string().c_str(), jsonErr.message.c_str(), jsonErr.line, jsonErr.column);
        return SetError(err, ErrorCode::ParseError, path.string() + ": " + jsonErr.message);
    }

    if (!ParseHostConfig(j, out, err)) {
        AK_LOG_ERROR(LOG_CATEGORY, "Invalid configuration in %s", path.string().c_str());
        return false;
    }

    AK_LOG_INFO(LOG_CATEGORY, "Loaded configuration from %s (ledger backend: %s)",
        path.string().c_str(), std::string(Ledger::GetLedgerBackendName(out.ledger.backend)).c_str());
    return true;
}

Json HostConfigToJson(const HostConfig& config) {
    Json j;

    Json& logging = j["logging"];
    logging["minLevel"] = Utils::LogLevelName(config.logging.minimalLevel);
    logging["toConsole"] = config.logging.toConsole;
    logging["toFile"] = config.logging.toFile;
    logging["logDirectory"] = config.logging.logDirectory;
    logging["baseFileName"] = config.logging.baseFileName;
    logging["jsonLines"] = config.logging.jsonLines;
    logging["async"] = config.logging.async;
    logging["maxFileSizeBytes"] = config.logging.maxFileSizeBytes;
    logging["maxFileCount"] = config.logging.maxFileCount;

    Json& ledger = j["ledger"];
    ledger["backend"] = std::string(Ledger::GetLedgerBackendName(config.ledger.backend));
    ledger["path"] = config.ledger.sqlite.databasePath;
    ledger["busyTimeoutMs"] = config.ledger.sqlite.busyTimeoutMs;
    ledger["journalMode"] = config.ledger.sqlite.journalMode;
    ledger["synchronousMode"] = config.ledger.sqlite.synchronousMode;

    Json& filesystem = j["filesystem"];
    filesystem["rootNamespace"] = config.addon.fileSystem.rootNamespace;
    filesystem["strictOwnership"] = config.addon.fileSystem.directory.strictOwnership;

    Json& addon = j["addon"];
    addon["logLedger"] = config.addon.logLedger;
    addon["settingsPrefix"] = config.addon.settingsPrefix;

    return j;
}

} // namespace Config
} // namespace AddonKit

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
#include "Directory.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace AddonKit {
namespace FileSystem {

namespace {
    constexpr const char* LOG_CATEGORY = "Directory";
    constexpr char SEPARATOR = ':';

    std::string KeyPrefix(const std::string& fileName) {
        return fileName + SEPARATOR;
    }

    // A ':' in a name would make its prefix match another file's entry.
    bool ValidateFileName(const std::string& fileName, Error* err) {
        if (fileName.find(SEPARATOR) != std::string::npos) {
            return SetError(err, ErrorCode::InvalidArgument,
                "File name " + fileName + " must not contain '" + SEPARATOR + "'");
        }
        return true;
    }
}

Directory::Directory(std::shared_ptr<Ledger::ILedger> ledger, std::string ownerId, DirectoryOptions options)
    : m_ledger(std::move(ledger))
    , m_dbId(m_ledger ? m_ledger->Name() : std::string())
    , m_ownerId(std::move(ownerId))
    , m_options(options) {
}

bool Directory::IsOwner() const noexcept {
    return !m_ownerId.empty() && m_dbId.find(m_ownerId) != std::string::npos;
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<Ledger::LedgerEntry> Directory::FindEntry(const std::string& fileName) const {
    const std::string prefix = KeyPrefix(fileName);

    Error listErr;
    for (auto& entry : m_ledger->ListEntries(&listErr)) {
        if (Utils::StringUtils::StartsWith(entry.label, prefix)) {
            return entry;
        }
    }
    if (listErr.HasError()) {
        AK_LOG_ERROR(LOG_CATEGORY, "Listing %s failed: %s", m_dbId.c_str(), listErr.message.c_str());
    }
    return std::nullopt;
}

bool Directory::DecodeContent(const std::string& fileName, const Ledger::LedgerEntry& entry,
                              Json& out, Error* err) const {
    const std::string_view raw = std::string_view(entry.label).substr(fileName.size() + 1);

    Utils::JSON::Error parseErr;
    if (!Utils::JSON::Parse(raw, out, &parseErr)) {
        AK_LOG_WARN(LOG_CATEGORY, "File %s in %s is not valid JSON: %s",
            fileName.c_str(), m_dbId.c_str(), parseErr.message.c_str());
        return SetError(err, ErrorCode::ParseError, "File " + fileName + " is corrupt: " + parseErr.message);
    }
    return true;
}

bool Directory::GuardMutation(const char* operation, const std::string& fileName,
                              Error* err, bool& result) const {
    if (IsOwner()) {
        return true;
    }

    if (m_options.strictOwnership) {
        AK_LOG_WARN(LOG_CATEGORY, "%s of %s refused: %s does not belong to %s",
            operation, fileName.c_str(), m_dbId.c_str(), m_ownerId.c_str());
        result = SetError(err, ErrorCode::PermissionDenied,
            "Directory " + m_dbId + " does not belong to addon: " + m_ownerId);
        return false;
    }

    AK_LOG_DEBUG(LOG_CATEGORY, "%s of %s skipped: %s does not belong to %s",
        operation, fileName.c_str(), m_dbId.c_str(), m_ownerId.c_str());
    result = true;
    return false;
}

bool Directory::Exists(const std::string& fileName) const {
    return FindEntry(fileName).has_value();
}

// ============================================================================
// Read / Write / Delete
// ============================================================================

std::optional<Json> Directory::Read(const std::string& fileName, Error* err) const {
    const auto entry = FindEntry(fileName);
    if (!entry) {
        SetError(err, ErrorCode::NotFound, "File " + fileName + " does not exist");
        return std::nullopt;
    }

    Json content;
    if (!DecodeContent(fileName, *entry, content, err)) {
        return std::nullopt;
    }
    return content;
}

bool Directory::Write(const std::string& fileName, const Json& content, bool allowOverwrite, Error* err) {
    if (!ValidateFileName(fileName, err)) {
        return false;
    }

    std::string serialized;
    if (!Utils::JSON::Stringify(content, serialized)) {
        return SetError(err, ErrorCode::InvalidArgument, "Content for " + fileName + " cannot be serialized");
    }

    const auto existing = FindEntry(fileName);
    if (existing && !allowOverwrite) {
        return SetError(err, ErrorCode::AlreadyExists, "File " + fileName + " already exists");
    }

    bool result = false;
    if (!GuardMutation("write", fileName, err, result)) {
        return result;
    }

    // Shadow the previous version: remove it, then append. Not atomic.
    if (existing && !m_ledger->RemoveEntry(existing->label, err)) {
        return false;
    }

    // Slot is read and used in two separate calls; interleaved writers may collide.
    Error listErr;
    const auto entries = m_ledger->ListEntries(&listErr);
    if (listErr.HasError()) {
        if (err) *err = listErr;
        return false;
    }
    const auto slot = static_cast<int64_t>(entries.size());

    return m_ledger->SetEntry(KeyPrefix(fileName) + serialized, slot, err);
}

bool Directory::Delete(const std::string& fileName, Error* err) {
    const auto entry = FindEntry(fileName);
    if (!entry) {
        return SetError(err, ErrorCode::NotFound, "File " + fileName + " does not exist");
    }

    bool result = false;
    if (!GuardMutation("delete", fileName, err, result)) {
        return result;
    }

    return m_ledger->RemoveEntry(entry->label, err);
}

// ============================================================================
// Rename / Copy / Move
// ============================================================================

bool Directory::Rename(const std::string& oldFileName, const std::string& newFileName, Error* err) {
    if (!ValidateFileName(newFileName, err)) {
        return false;
    }

    const auto entry = FindEntry(oldFileName);
    if (!entry) {
        return SetError(err, ErrorCode::NotFound, "File " + oldFileName + " does not exist");
    }
    if (Exists(newFileName)) {
        return SetError(err, ErrorCode::AlreadyExists, "File " + newFileName + " already exists");
    }

    bool result = false;
    if (!GuardMutation("rename", oldFileName, err, result)) {
        return result;
    }

    Json content;
    if (!DecodeContent(oldFileName, *entry, content, err)) {
        return false;
    }

    if (!Delete(oldFileName, err)) {
        return false;
    }
    if (!Write(newFileName, content, true, err)) {
        AK_LOG_ERROR(LOG_CATEGORY, "Rename %s -> %s in %s lost the file: write after delete failed",
            oldFileName.c_str(), newFileName.c_str(), m_dbId.c_str());
        return false;
    }
    return true;
}

bool Directory::Copy(const std::string& sourceFileName, const std::string& destinationFileName, Error* err) {
    if (!ValidateFileName(destinationFileName, err)) {
        return false;
    }

    const auto entry = FindEntry(sourceFileName);
    if (!entry) {
        return SetError(err, ErrorCode::NotFound, "Source file " + sourceFileName + " does not exist");
    }
    if (Exists(destinationFileName)) {
        return SetError(err, ErrorCode::AlreadyExists,
            "Destination file " + destinationFileName + " already exists");
    }

    bool result = false;
    if (!GuardMutation("copy", sourceFileName, err, result)) {
        return result;
    }

    Json content;
    if (!DecodeContent(sourceFileName, *entry, content, err)) {
        return false;
    }
    return Write(destinationFileName, content, true, err);
}

bool Directory::Move(const std::string& sourceFileName, const std::string& destinationFileName, Error* err) {
    if (!IsOwner()) {
        AK_LOG_DEBUG(LOG_CATEGORY, "move of %s requested by non-owner %s of %s",
            sourceFileName.c_str(), m_ownerId.c_str(), m_dbId.c_str());
    }

    if (!Copy(sourceFileName, destinationFileName, err)) {
        return false;
    }
    return Delete(sourceFileName, err);
}

// ============================================================================
// Sizes / Listing
// ============================================================================

std::optional<size_t> Directory::FileSize(const std::string& fileName, Error* err) const {
    const auto content = Read(fileName, err);
    if (!content) {
        return std::nullopt;
    }
    return Utils::StringUtils::CodePointCount(Utils::JSON::ToCompactString(*content));
}

size_t Directory::Size() const {
    size_t total = 0;
    for (const auto& entry : m_ledger->ListEntries()) {
        total += Utils::StringUtils::CodePointCount(entry.label);
    }
    return total;
}

std::vector<std::string> Directory::List() const {
    std::vector<std::string> names;
    for (const auto& entry : m_ledger->ListEntries()) {
        names.push_back(entry.label.substr(0, entry.label.find(SEPARATOR)));
    }
    return names;
}

} // namespace FileSystem
} // namespace AddonKit

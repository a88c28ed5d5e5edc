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
 * AddonKit Directory - HEADER
 * ============================================================================
 *
 * @file Directory.hpp
 * @brief One emulated file system directory stored in one ledger.
 *
 * Encoding:
 * ---------
 * Every file is a single ledger entry:
 *
 *   label = "<fileName>:<compact JSON content>"
 *   value = insertion slot (entry count at the time of the write)
 *
 * Lookups scan the entries for the "<fileName>:" prefix, so every operation
 * is O(n) in the entry count. File names must not contain ':'; writes,
 * rename and copy targets that do fail with InvalidArgument.
 *
 * Sizes are counted in characters (code points), not bytes.
 *
 * Ownership:
 * ----------
 * A directory may be mutated only by the addon whose upper-cased identity is
 * a substring of the backing ledger name. Non-owner mutations are skipped and
 * reported as success, unless strict ownership is enabled, in which case they
 * fail with PermissionDenied. Argument checks (NotFound, AlreadyExists) run
 * before the ownership check in both modes.
 *
 * Atomicity:
 * ----------
 * Overwrite, Rename and Move are sequences of independent ledger calls
 * (remove then insert, copy then delete). A failure between the calls can
 * lose or duplicate a file. The slot for a new entry is read and then used in
 * two calls, so interleaved writers can receive the same slot.
 *
 * Thread Safety:
 * --------------
 * None. Intended for the host's single cooperative thread.
 */

#include "../Core/Error.hpp"
#include "../Ledger/LedgerStore.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace AddonKit {
namespace FileSystem {

using Json = nlohmann::json;

struct DirectoryOptions {
    /// Report non-owner mutations as PermissionDenied instead of skipping them
    bool strictOwnership = false;
};

class Directory {
public:
    /**
     * @param ledger Backing ledger
     * @param ownerId Upper-cased identity of the calling addon
     */
    Directory(std::shared_ptr<Ledger::ILedger> ledger, std::string ownerId, DirectoryOptions options = {});

    /// @brief Name of the backing ledger.
    [[nodiscard]] const std::string& DbId() const noexcept { return m_dbId; }

    [[nodiscard]] const std::string& OwnerId() const noexcept { return m_ownerId; }

    /// @brief True if the calling addon may mutate this directory.
    [[nodiscard]] bool IsOwner() const noexcept;

    [[nodiscard]] bool Exists(const std::string& fileName) const;

    /**
     * @brief Read and parse a file.
     * @return nullopt with NotFound if absent, ParseError if the stored text is corrupt
     */
    [[nodiscard]] std::optional<Json> Read(const std::string& fileName, Error* err = nullptr) const;

    /**
     * @brief Store @p content under @p fileName.
     *
     * Fails with AlreadyExists if the file exists and @p allowOverwrite is
     * false. Overwriting removes the old entry, then appends the new one.
     */
    [[nodiscard]] bool Write(const std::string& fileName, const Json& content,
                             bool allowOverwrite = true, Error* err = nullptr);

    [[nodiscard]] bool Delete(const std::string& fileName, Error* err = nullptr);

    /**
     * @brief Delete @p oldFileName, then write its content as @p newFileName.
     *
     * Not atomic. If the write fails after the delete succeeded, the content
     * is lost.
     */
    [[nodiscard]] bool Rename(const std::string& oldFileName, const std::string& newFileName,
                              Error* err = nullptr);

    [[nodiscard]] bool Copy(const std::string& sourceFileName, const std::string& destinationFileName,
                            Error* err = nullptr);

    /**
     * @brief Copy, then delete the source. Each step checks arguments and
     * ownership on its own; a failed delete leaves both files.
     */
    [[nodiscard]] bool Move(const std::string& sourceFileName, const std::string& destinationFileName,
                            Error* err = nullptr);

    /// @brief Length in characters of the serialized content (not the whole entry).
    [[nodiscard]] std::optional<size_t> FileSize(const std::string& fileName, Error* err = nullptr) const;

    /// @brief Sum of the full encoded label lengths of every entry, in characters.
    [[nodiscard]] size_t Size() const;

    /// @brief File names in ledger order.
    [[nodiscard]] std::vector<std::string> List() const;

private:
    [[nodiscard]] std::optional<Ledger::LedgerEntry> FindEntry(const std::string& fileName) const;

    [[nodiscard]] bool DecodeContent(const std::string& fileName, const Ledger::LedgerEntry& entry,
                                     Json& out, Error* err) const;

    /**
     * @brief Ownership gate for mutations.
     * @return true if the mutation should run; otherwise @p result is what the caller returns
     */
    [[nodiscard]] bool GuardMutation(const char* operation, const std::string& fileName,
                                     Error* err, bool& result) const;

    std::shared_ptr<Ledger::ILedger> m_ledger;
    std::string m_dbId;
    std::string m_ownerId;
    DirectoryOptions m_options;
};

} // namespace FileSystem
} // namespace AddonKit

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
 * @file Error.hpp
 * @brief Shared status vocabulary for AddonKit modules.
 *
 * Fallible operations return bool (or std::optional) and accept an optional
 * Error* out-parameter that is filled on failure. Nothing throws across the
 * public API.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace AddonKit {

/**
 * @brief Failure categories reported by AddonKit operations.
 */
enum class ErrorCode : uint8_t {
    None = 0,
    NotFound,            ///< File, directory or ledger missing
    AlreadyExists,       ///< Conflicting create/rename/copy target
    PermissionDenied,    ///< Non-owner mutation (strict ownership only)
    Uninitialized,       ///< Addon identity not established yet
    AlreadyInitialized,  ///< Addon identity established twice
    InvalidArgument,     ///< Malformed input or configuration
    ParseError,          ///< Stored or received text is not valid JSON
    StorageError         ///< Backing store failure
};

/**
 * @brief Error record filled by fallible operations.
 */
struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    [[nodiscard]] bool HasError() const noexcept { return code != ErrorCode::None; }

    void Clear() noexcept {
        code = ErrorCode::None;
        message.clear();
    }
};

[[nodiscard]] constexpr std::string_view GetErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:               return "None";
        case ErrorCode::NotFound:           return "NotFound";
        case ErrorCode::AlreadyExists:      return "AlreadyExists";
        case ErrorCode::PermissionDenied:   return "PermissionDenied";
        case ErrorCode::Uninitialized:      return "Uninitialized";
        case ErrorCode::AlreadyInitialized: return "AlreadyInitialized";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::ParseError:         return "ParseError";
        case ErrorCode::StorageError:       return "StorageError";
    }
    return "Unknown";
}

/// @brief Fill @p err when the caller asked for details. Always returns false.
inline bool SetError(Error* err, ErrorCode code, std::string message) {
    if (err) {
        err->code = code;
        err->message = std::move(message);
    }
    return false;
}

} // namespace AddonKit

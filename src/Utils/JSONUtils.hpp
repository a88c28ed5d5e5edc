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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and lookup helpers for AddonKit.
 *
 * Provides:
 * - Safe parsing with depth limits
 * - Compact serialization matching the wire form stored in ledger labels
 * - File loading for configuration
 * - Dot/bracket path navigation with typed getters
 *
 * Implementation uses nlohmann/json with non-throwing wrappers.
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace AddonKit {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json
			using Json = nlohmann::json;

			// ============================================================================
			// Limits
			// ============================================================================

			/// Maximum nesting depth accepted by Parse
			inline constexpr size_t MAX_JSON_DEPTH = 512;

			/// Default file size limit for LoadFromFile (4MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 4ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information for JSON operations.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< Approximate line number (1-based, 0 = unknown)
				size_t column = 0;                ///< Approximate column number (1-based, 0 = unknown)

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			struct ParseOptions {
				bool allowComments = false;        ///< Allow // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing with indentation
				int indentSpaces = 2;              ///< Number of spaces per indent level
				bool ensureAscii = false;          ///< Escape non-ASCII characters
			};

			// ============================================================================
			// Text
			// ============================================================================

			/**
			 * @brief Parse JSON text.
			 * @param jsonText Input text
			 * @param out Parsed value (untouched on failure)
			 * @param err Optional error details
			 * @return true on success
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Serialize a value. Compact output has no whitespace.
			 *
			 * Invalid UTF-8 in strings is replaced rather than failing.
			 */
			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			/// @brief Compact serialization; empty string only if serialization failed.
			[[nodiscard]] std::string ToCompactString(const Json& j) noexcept;

			// ============================================================================
			// Files
			// ============================================================================

			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			// ============================================================================
			// Path helpers
			// ============================================================================

			/**
			 * @brief Convert "a.b[0].c" (or an existing "/a/b") to a JSON Pointer.
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			/**
			 * @brief Typed lookup. Returns false if the path is missing or the type does not convert.
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty()) {
						out = j.template get<T>();
						return true;
					}
					const Json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const Json::exception&) {
					return false;
				}
			}

			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return std::move(defaultValue);
			}

		} // namespace JSON
	} // namespace Utils
} // namespace AddonKit

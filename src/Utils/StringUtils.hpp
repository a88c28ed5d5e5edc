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
 * @file StringUtils.hpp
 * @brief ASCII case mapping and splitting helpers used for ledger naming.
 */

#include <string>
#include <string_view>
#include <vector>

namespace AddonKit {
	namespace Utils {
		namespace StringUtils {

			/// @brief Upper-case ASCII letters; other bytes (including UTF-8) are kept.
			[[nodiscard]] std::string ToUpperAscii(std::string_view s);

			[[nodiscard]] std::string ToLowerAscii(std::string_view s);

			[[nodiscard]] inline bool StartsWith(std::string_view s, std::string_view prefix) noexcept {
				return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
			}

			/**
			 * @brief Number of characters (Unicode code points) in UTF-8 text.
			 *
			 * Counts every byte that is not a UTF-8 continuation byte, so invalid
			 * sequences still count one per lead byte.
			 */
			[[nodiscard]] size_t CodePointCount(std::string_view utf8) noexcept;

			/// @brief Split on every occurrence of @p delim. Empty fields are kept.
			[[nodiscard]] std::vector<std::string> Split(std::string_view s, char delim);

		} // namespace StringUtils
	} // namespace Utils
} // namespace AddonKit

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
#include "StringUtils.hpp"

namespace AddonKit {
	namespace Utils {
		namespace StringUtils {

			std::string ToUpperAscii(std::string_view s) {
				std::string out(s);
				for (auto& c : out) {
					if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
				}
				return out;
			}

			std::string ToLowerAscii(std::string_view s) {
				std::string out(s);
				for (auto& c : out) {
					if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
				}
				return out;
			}

			size_t CodePointCount(std::string_view utf8) noexcept {
				size_t count = 0;
				for (const char c : utf8) {
					if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
				}
				return count;
			}

			std::vector<std::string> Split(std::string_view s, char delim) {
				std::vector<std::string> parts;
				size_t start = 0;
				for (;;) {
					const size_t pos = s.find(delim, start);
					if (pos == std::string_view::npos) {
						parts.emplace_back(s.substr(start));
						break;
					}
					parts.emplace_back(s.substr(start, pos - start));
					start = pos + 1;
				}
				return parts;
			}

		} // namespace StringUtils
	} // namespace Utils
} // namespace AddonKit

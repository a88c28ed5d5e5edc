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
#include "JSONUtils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace AddonKit {
	namespace Utils {
		namespace JSON {

			namespace {

				void FillLineColumn(std::string_view text, size_t byteOffset, Error* err) {
					if (!err || byteOffset == 0) return;
					size_t line = 1;
					size_t column = 1;
					const size_t end = std::min(byteOffset, text.size());
					for (size_t i = 0; i + 1 < end; ++i) {
						if (text[i] == '\n') {
							++line;
							column = 1;
						}
						else {
							++column;
						}
					}
					err->line = line;
					err->column = column;
				}

				[[nodiscard]] size_t Depth(const Json& j, size_t limit) {
					if (!j.is_structured()) return 0;
					size_t deepest = 0;
					for (const auto& child : j) {
						const size_t d = Depth(child, limit);
						if (d > deepest) deepest = d;
						if (deepest >= limit) break;
					}
					return deepest + 1;
				}

			} // namespace

			// ============================================================================
			// Text
			// ============================================================================

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				if (err) err->clear();
				try {
					Json parsed = Json::parse(jsonText.begin(), jsonText.end(), nullptr, true, opt.allowComments);
					if (Depth(parsed, opt.maxDepth + 1) > opt.maxDepth) {
						if (err) err->message = "JSON nesting exceeds maximum depth";
						return false;
					}
					out = std::move(parsed);
					return true;
				}
				catch (const Json::parse_error& ex) {
					if (err) {
						err->message = ex.what();
						err->byteOffset = ex.byte;
						FillLineColumn(jsonText, ex.byte, err);
					}
					return false;
				}
				catch (const std::exception& ex) {
					if (err) err->message = ex.what();
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', opt.ensureAscii,
						Json::error_handler_t::replace);
					return true;
				}
				catch (const std::exception&) {
					return false;
				}
			}

			std::string ToCompactString(const Json& j) noexcept {
				std::string out;
				if (!Stringify(j, out)) {
					return std::string();
				}
				return out;
			}

			// ============================================================================
			// Files
			// ============================================================================

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				if (err) err->clear();
				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						if (err) {
							err->message = "cannot stat file: " + ec.message();
							err->path = path;
						}
						return false;
					}
					if (size > maxBytes) {
						if (err) {
							err->message = "file exceeds size limit";
							err->path = path;
						}
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						if (err) {
							err->message = "cannot open file";
							err->path = path;
						}
						return false;
					}
					std::ostringstream buffer;
					buffer << in.rdbuf();
					const std::string text = buffer.str();

					if (!Parse(text, out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::exception& ex) {
					if (err) {
						err->message = ex.what();
						err->path = path;
					}
					return false;
				}
			}

			// ============================================================================
			// Path helpers
			// ============================================================================

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty() || pathLike == "/") return std::string();
					if (pathLike.front() == '/') return std::string(pathLike);

					std::string out;
					out.reserve(pathLike.size() + 8);
					std::string token;

					auto flush = [&]() {
						if (token.empty()) return;
						out.push_back('/');
						for (char c : token) {
							if (c == '~') out += "~0";
							else if (c == '/') out += "~1";
							else out.push_back(c);
						}
						token.clear();
					};

					for (char c : pathLike) {
						if (c == '.' || c == '[' || c == ']') {
							flush();
						}
						else {
							token.push_back(c);
						}
					}
					flush();
					return out;
				}
				catch (const std::exception&) {
					return std::string();
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty()) return true;
					return j.contains(Json::json_pointer(jp));
				}
				catch (const std::exception&) {
					return false;
				}
			}

		} // namespace JSON
	} // namespace Utils
} // namespace AddonKit

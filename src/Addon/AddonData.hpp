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
 * AddonKit Addon Descriptor - HEADER
 * ============================================================================
 *
 * @file AddonData.hpp
 * @brief Addon metadata, extensions and settings widget schema.
 *
 * JSON shape:
 * -----------
 * @code
 * {
 *   "formatVersion": "1.0.0",
 *   "description": { "version": "1.0.0", "author": "vxl", "packId": "ores",
 *                    "dependencies": ["..."] },
 *   "iconPath": "textures/...",
 *   "guideKeys": ["..."],
 *   "extensions": [ { "id": "ores:menu", "iconPath": "..." } ],
 *   "settings": [ <widget>... ]  or  [ { "title": "...", "settings": [...] }... ]
 * }
 * @endcode
 *
 * Widgets are discriminated by their fields: "options" is a dropdown,
 * "min"/"max"/"step" a slider, "placeholder" a text field, otherwise a toggle.
 */

#include "../Core/Error.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace AddonKit {
namespace Addon {

using Json = nlohmann::json;

// ============================================================================
// Icons
// ============================================================================

namespace Icons {
    inline constexpr const char* Acm       = "textures/vxl/acm/icons/acm_icon";
    inline constexpr const char* Exclaim   = "textures/vxl/acm/icons/exclaim";
    inline constexpr const char* Logs      = "textures/vxl/acm/icons/logs";
    inline constexpr const char* Missing   = "textures/vxl/acm/icons/missing";
    inline constexpr const char* Question  = "textures/vxl/acm/icons/question";
    inline constexpr const char* Return    = "textures/vxl/acm/icons/return";
    inline constexpr const char* Settings  = "textures/vxl/acm/icons/settings";
    inline constexpr const char* Uninstall = "textures/vxl/acm/icons/uninstall";
}

// ============================================================================
// Settings widgets
// ============================================================================

struct TextFieldWidget {
    std::string label;
    std::string placeholder;
    std::optional<std::string> value;
};

struct DropdownWidget {
    std::string label;
    std::vector<std::string> options;
    std::optional<int64_t> valueIndex;
    std::optional<std::string> value;
};

struct SliderWidget {
    std::string label;
    double min = 0.0;
    double max = 0.0;
    double step = 1.0;
    std::optional<double> value;
};

struct ToggleWidget {
    std::string label;
    std::optional<bool> value;
};

using SettingsWidget = std::variant<TextFieldWidget, DropdownWidget, SliderWidget, ToggleWidget>;

struct SettingsCategory {
    std::string title;
    std::vector<SettingsWidget> settings;
    std::optional<std::string> iconPath;
};

using WidgetList = std::vector<SettingsWidget>;
using CategoryList = std::vector<SettingsCategory>;

/// @brief Either a flat widget list or a list of categories.
using AddonSettings = std::variant<WidgetList, CategoryList>;

[[nodiscard]] const std::string& GetWidgetLabel(const SettingsWidget& widget) noexcept;

/**
 * @brief Resolved value of one widget.
 *
 * Dropdowns with a valueIndex resolve to options[valueIndex] (null when out of
 * range). Widgets without a value resolve to null.
 */
[[nodiscard]] Json ResolveWidgetValue(const SettingsWidget& widget);

[[nodiscard]] Json WidgetToJson(const SettingsWidget& widget);

[[nodiscard]] bool WidgetFromJson(const Json& j, SettingsWidget& out, Error* err = nullptr);

/// @brief Parse a JSON array of widgets, as stored in a settings ledger.
[[nodiscard]] bool WidgetListFromJson(const Json& j, WidgetList& out, Error* err = nullptr);

// ============================================================================
// Descriptor
// ============================================================================

struct ExtensionData {
    std::string id;
    std::optional<std::string> iconPath;
};

struct AddonDescription {
    std::string version;
    std::string author;
    std::string packId;
    std::optional<std::vector<std::string>> dependencies;
};

struct AddonData {
    std::string formatVersion;
    AddonDescription description;
    std::optional<std::string> iconPath;
    std::optional<std::vector<std::string>> guideKeys;
    std::optional<std::vector<ExtensionData>> extensions;
    std::optional<AddonSettings> settings;

    /// @brief "<author>_<packId>" as declared (case preserved).
    [[nodiscard]] std::string Identifier() const;

    /// @brief True when settings is a non-empty category list.
    [[nodiscard]] bool HasSettingsCategories() const noexcept;

    [[nodiscard]] Json ToJson() const;

    /**
     * @brief Parse a descriptor.
     * @return false with InvalidArgument if a required field is missing or mistyped
     */
    [[nodiscard]] static bool FromJson(const Json& j, AddonData& out, Error* err = nullptr);
};

} // namespace Addon
} // namespace AddonKit

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
#include "AddonData.hpp"

#include <type_traits>

namespace AddonKit {
namespace Addon {

namespace {

    template <typename T>
    void PutOptional(Json& j, const char* key, const std::optional<T>& value) {
        if (value) {
            j[key] = *value;
        }
    }

    template <typename T>
    void ReadOptional(const Json& j, const char* key, std::optional<T>& out) {
        const auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            out = it->template get<T>();
        }
    }

    // Throws Json::exception on a missing or mistyped field; callers convert.
    SettingsWidget ParseWidget(const Json& j) {
        if (j.contains("options")) {
            DropdownWidget w;
            w.label = j.at("label").get<std::string>();
            w.options = j.at("options").get<std::vector<std::string>>();
            ReadOptional(j, "valueIndex", w.valueIndex);
            ReadOptional(j, "value", w.value);
            return w;
        }
        if (j.contains("min") || j.contains("max") || j.contains("step")) {
            SliderWidget w;
            w.label = j.at("label").get<std::string>();
            w.min = j.at("min").get<double>();
            w.max = j.at("max").get<double>();
            w.step = j.at("step").get<double>();
            ReadOptional(j, "value", w.value);
            return w;
        }
        if (j.contains("placeholder")) {
            TextFieldWidget w;
            w.label = j.at("label").get<std::string>();
            w.placeholder = j.at("placeholder").get<std::string>();
            ReadOptional(j, "value", w.value);
            return w;
        }

        ToggleWidget w;
        w.label = j.at("label").get<std::string>();
        ReadOptional(j, "value", w.value);
        return w;
    }

    WidgetList ParseWidgetList(const Json& j) {
        WidgetList widgets;
        for (const auto& item : j.get<std::vector<Json>>()) {
            widgets.push_back(ParseWidget(item));
        }
        return widgets;
    }

    Json WidgetListToJson(const WidgetList& widgets) {
        Json arr = Json::array();
        for (const auto& w : widgets) {
            arr.push_back(WidgetToJson(w));
        }
        return arr;
    }

} // anonymous namespace

// ============================================================================
// Widgets
// ============================================================================

const std::string& GetWidgetLabel(const SettingsWidget& widget) noexcept {
    return std::visit([](const auto& w) -> const std::string& { return w.label; }, widget);
}

Json ResolveWidgetValue(const SettingsWidget& widget) {
    if (const auto* dropdown = std::get_if<DropdownWidget>(&widget)) {
        if (dropdown->valueIndex) {
            const int64_t index = *dropdown->valueIndex;
            if (index < 0 || static_cast<size_t>(index) >= dropdown->options.size() ||
                dropdown->options[static_cast<size_t>(index)].empty()) {
                return nullptr;
            }
            return dropdown->options[static_cast<size_t>(index)];
        }
        return dropdown->value ? Json(*dropdown->value) : Json(nullptr);
    }

    return std::visit([](const auto& w) -> Json {
        using W = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<W, DropdownWidget>) {
            return nullptr;
        }
        else {
            return w.value ? Json(*w.value) : Json(nullptr);
        }
    }, widget);
}

Json WidgetToJson(const SettingsWidget& widget) {
    return std::visit([](const auto& w) -> Json {
        using W = std::decay_t<decltype(w)>;
        Json j;
        j["label"] = w.label;
        if constexpr (std::is_same_v<W, TextFieldWidget>) {
            j["placeholder"] = w.placeholder;
        }
        else if constexpr (std::is_same_v<W, DropdownWidget>) {
            j["options"] = w.options;
            PutOptional(j, "valueIndex", w.valueIndex);
        }
        else if constexpr (std::is_same_v<W, SliderWidget>) {
            j["min"] = w.min;
            j["max"] = w.max;
            j["step"] = w.step;
        }
        PutOptional(j, "value", w.value);
        return j;
    }, widget);
}

bool WidgetFromJson(const Json& j, SettingsWidget& out, Error* err) {
    try {
        out = ParseWidget(j);
        return true;
    }
    catch (const Json::exception& ex) {
        return SetError(err, ErrorCode::InvalidArgument, std::string("Invalid settings widget: ") + ex.what());
    }
}

bool WidgetListFromJson(const Json& j, WidgetList& out, Error* err) {
    if (!j.is_array()) {
        return SetError(err, ErrorCode::InvalidArgument, "Settings data is not an array");
    }
    try {
        out = ParseWidgetList(j);
        return true;
    }
    catch (const Json::exception& ex) {
        return SetError(err, ErrorCode::InvalidArgument, std::string("Invalid settings widget: ") + ex.what());
    }
}

// ============================================================================
// AddonData
// ============================================================================

std::string AddonData::Identifier() const {
    return description.author + "_" + description.packId;
}

bool AddonData::HasSettingsCategories() const noexcept {
    if (!settings) {
        return false;
    }
    const auto* categories = std::get_if<CategoryList>(&*settings);
    return categories && !categories->empty();
}

Json AddonData::ToJson() const {
    Json j;
    j["formatVersion"] = formatVersion;

    Json desc;
    desc["version"] = description.version;
    desc["author"] = description.author;
    desc["packId"] = description.packId;
    PutOptional(desc, "dependencies", description.dependencies);
    j["description"] = std::move(desc);

    PutOptional(j, "iconPath", iconPath);
    PutOptional(j, "guideKeys", guideKeys);

    if (extensions) {
        Json arr = Json::array();
        for (const auto& ext : *extensions) {
            Json e;
            e["id"] = ext.id;
            PutOptional(e, "iconPath", ext.iconPath);
            arr.push_back(std::move(e));
        }
        j["extensions"] = std::move(arr);
    }

    if (settings) {
        if (const auto* widgets = std::get_if<WidgetList>(&*settings)) {
            j["settings"] = WidgetListToJson(*widgets);
        }
        else {
            Json arr = Json::array();
            for (const auto& category : std::get<CategoryList>(*settings)) {
                Json c;
                c["title"] = category.title;
                c["settings"] = WidgetListToJson(category.settings);
                PutOptional(c, "iconPath", category.iconPath);
                arr.push_back(std::move(c));
            }
            j["settings"] = std::move(arr);
        }
    }
    return j;
}

bool AddonData::FromJson(const Json& j, AddonData& out, Error* err) {
    if (!j.is_object()) {
        return SetError(err, ErrorCode::InvalidArgument, "Addon data must be a JSON object");
    }

    try {
        AddonData data;
        data.formatVersion = j.at("formatVersion").get<std::string>();

        const Json& desc = j.at("description");
        data.description.version = desc.at("version").get<std::string>();
        data.description.author = desc.at("author").get<std::string>();
        data.description.packId = desc.at("packId").get<std::string>();
        ReadOptional(desc, "dependencies", data.description.dependencies);

        ReadOptional(j, "iconPath", data.iconPath);
        ReadOptional(j, "guideKeys", data.guideKeys);

        if (const auto it = j.find("extensions"); it != j.end() && !it->is_null()) {
            std::vector<ExtensionData> exts;
            for (const auto& e : *it) {
                ExtensionData ext;
                ext.id = e.at("id").get<std::string>();
                ReadOptional(e, "iconPath", ext.iconPath);
                exts.push_back(std::move(ext));
            }
            data.extensions = std::move(exts);
        }

        if (const auto it = j.find("settings"); it != j.end() && !it->is_null()) {
            if (!it->is_array()) {
                return SetError(err, ErrorCode::InvalidArgument, "settings must be an array");
            }
            if (!it->empty() && it->front().is_object() && it->front().contains("title")) {
                CategoryList categories;
                for (const auto& c : *it) {
                    SettingsCategory category;
                    category.title = c.at("title").get<std::string>();
                    category.settings = ParseWidgetList(c.at("settings"));
                    ReadOptional(c, "iconPath", category.iconPath);
                    categories.push_back(std::move(category));
                }
                data.settings = std::move(categories);
            }
            else {
                data.settings = ParseWidgetList(*it);
            }
        }

        out = std::move(data);
        return true;
    }
    catch (const Json::exception& ex) {
        return SetError(err, ErrorCode::InvalidArgument, std::string("Invalid addon data: ") + ex.what());
    }
}

} // namespace Addon
} // namespace AddonKit

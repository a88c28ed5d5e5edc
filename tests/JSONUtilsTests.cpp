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
#include <gtest/gtest.h>

#include "../src/Utils/JSONUtils.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace AddonKit::Utils;
using JSON::Json;

TEST(JSONUtilsTest, ParseReportsLineAndColumn) {
    Json out = 7;
    JSON::Error err;

    EXPECT_FALSE(JSON::Parse("{\n  \"a\": tru\n}", out, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.line, 2u);
    EXPECT_GT(err.column, 1u);
    EXPECT_EQ(out, Json(7));
}

TEST(JSONUtilsTest, CommentsNeedOptIn) {
    const std::string text = "{ \"a\": 1 // note\n}";
    Json out;

    EXPECT_FALSE(JSON::Parse(text, out));

    JSON::ParseOptions opts;
    opts.allowComments = true;
    ASSERT_TRUE(JSON::Parse(text, out, nullptr, opts));
    EXPECT_EQ(out["a"], 1);
}

TEST(JSONUtilsTest, ParseEnforcesDepthLimit) {
    JSON::ParseOptions opts;
    opts.maxDepth = 3;
    Json out;
    JSON::Error err;

    EXPECT_TRUE(JSON::Parse("[[[1]]]", out, &err, opts));
    EXPECT_FALSE(JSON::Parse("[[[[1]]]]", out, &err, opts));
    EXPECT_TRUE(err.hasError());
}

TEST(JSONUtilsTest, CompactStringHasNoWhitespace) {
    const Json j = { { "k", 1 }, { "list", { 1, 2 } } };
    EXPECT_EQ(JSON::ToCompactString(j), R"({"k":1,"list":[1,2]})");
    EXPECT_EQ(JSON::ToCompactString(Json("hi")), "\"hi\"");
}

TEST(JSONUtilsTest, StringifyPretty) {
    JSON::StringifyOptions opts;
    opts.pretty = true;
    opts.indentSpaces = 4;

    std::string out;
    ASSERT_TRUE(JSON::Stringify(Json{ { "a", 1 } }, out, opts));
    EXPECT_EQ(out, "{\n    \"a\": 1\n}");
}

TEST(JSONUtilsTest, PathHelpers) {
    EXPECT_EQ(JSON::ToJsonPointer("ledger.path"), "/ledger/path");
    EXPECT_EQ(JSON::ToJsonPointer("settings[1].label"), "/settings/1/label");
    EXPECT_EQ(JSON::ToJsonPointer("/already/pointer"), "/already/pointer");
    EXPECT_EQ(JSON::ToJsonPointer("a/b"), "/a~1b");

    const Json j = Json::parse(R"({ "settings": [ { "label": "A" }, { "label": "B" } ] })");
    EXPECT_TRUE(JSON::Contains(j, "settings[1].label"));
    EXPECT_FALSE(JSON::Contains(j, "settings[2].label"));

    std::string label;
    EXPECT_TRUE(JSON::Get(j, "settings[1].label", label));
    EXPECT_EQ(label, "B");

    int wrongType = 0;
    EXPECT_FALSE(JSON::Get(j, "settings[0].label", wrongType));
    EXPECT_EQ(JSON::GetOr<std::string>(j, "settings[5].label", "none"), "none");
}

TEST(JSONUtilsTest, LoadFromFileReportsPath) {
    const auto dir = std::filesystem::temp_directory_path() / "addonkit_jsonutils";
    std::filesystem::create_directories(dir);
    const auto path = dir / "broken.json";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "{ \"a\": ";
    }

    Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::LoadFromFile(path, j, &err));
    EXPECT_EQ(err.path, path);

    err.clear();
    EXPECT_FALSE(JSON::LoadFromFile(dir / "missing.json", j, &err));
    EXPECT_TRUE(err.hasError());

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

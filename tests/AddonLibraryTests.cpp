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
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/Addon/AddonLibrary.hpp"
#include "../src/Ledger/MemoryLedgerStore.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace AddonKit;
using namespace AddonKit::Addon;

namespace {

/**
 * @brief Records broadcasts and resolves actors from a fixed table.
 */
class FakeHostRuntime final : public IHostRuntime {
public:
    void SendBroadcast(const std::string& id, const std::string& message) override {
        sent.emplace_back(id, message);
    }

    std::optional<Actor> FindActor(const std::string& actorId) override {
        const auto it = actors.find(actorId);
        if (it == actors.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::pair<std::string, std::string>> sent;
    std::map<std::string, Actor> actors;
};

class MockHostRuntime : public IHostRuntime {
public:
    MOCK_METHOD(void, SendBroadcast, (const std::string& id, const std::string& message), (override));
    MOCK_METHOD(std::optional<Actor>, FindActor, (const std::string& actorId), (override));
};

AddonData MakeAddon() {
    AddonData data;
    data.formatVersion = "1.0.0";
    data.description.version = "1.0.0";
    data.description.author = "vxl";
    data.description.packId = "ores";
    data.extensions = std::vector<ExtensionData>{ { "ores:menu", std::nullopt } };

    ToggleWidget enabled;
    enabled.label = "Enabled";
    data.settings = WidgetList{ enabled };
    return data;
}

AddonData MakeCategoryAddon() {
    AddonData data = MakeAddon();
    SettingsCategory general;
    general.title = "General";
    SettingsCategory audio;
    audio.title = "Audio";
    data.settings = CategoryList{ general, audio };
    return data;
}

} // namespace

class AddonLibraryTest : public ::testing::Test {
protected:
    AddonLibraryTest()
        : m_acm(m_store, m_host, m_hub) {
    }

    void Init(AddonData data = MakeAddon()) {
        Error err;
        ASSERT_TRUE(m_acm.InitAddon(std::move(data), &err)) << err.message;
    }

    /// Store @p widgets the way the host UI does: JSON array at value 0.
    void StoreSettings(const std::string& ledgerName, const std::string& widgetsJson) {
        auto ledger = m_store.GetNamed(ledgerName);
        if (!ledger) {
            ledger = m_store.CreateNamed(ledgerName);
        }
        ASSERT_NE(ledger, nullptr);
        ASSERT_TRUE(ledger->SetEntry("stale-marker", 3));
        ASSERT_TRUE(ledger->SetEntry(widgetsJson, 0));
    }

    Ledger::MemoryLedgerStore m_store;
    FakeHostRuntime m_host;
    Signals::SignalHub m_hub;
    AddonLibrary m_acm;
};

// ============================================================================
// Identity
// ============================================================================

TEST_F(AddonLibraryTest, InitAddonOnlyOnce) {
    EXPECT_FALSE(m_acm.IsInitialized());
    EXPECT_FALSE(m_acm.Identifier().has_value());

    Init();
    EXPECT_EQ(m_acm.Identifier(), std::optional<std::string>("vxl_ores"));

    Error err;
    EXPECT_FALSE(m_acm.InitAddon(MakeAddon(), &err));
    EXPECT_EQ(err.code, ErrorCode::AlreadyInitialized);
    EXPECT_EQ(err.message, "Addon already initialized");
}

// ============================================================================
// Inbound host messages
// ============================================================================

TEST_F(AddonLibraryTest, EngineReadyAnnouncesAddonAndEmitsReady) {
    Init();
    std::optional<AddonData> ready;
    m_acm.Events().OnAddonReady.Subscribe([&ready](const Signals::AddonReadyEvent& e) { ready = e.addonData; });

    ASSERT_TRUE(m_acm.HandleHostMessage("acm:engine_ready", ""));

    ASSERT_EQ(m_host.sent.size(), 1u);
    EXPECT_EQ(m_host.sent[0].first, "acm:addon_ready");
    EXPECT_EQ(Json::parse(m_host.sent[0].second), MakeAddon().ToJson());
    ASSERT_TRUE(ready.has_value());
    EXPECT_EQ(ready->Identifier(), "vxl_ores");
}

TEST_F(AddonLibraryTest, EngineReadyBeforeInitIsUninitialized) {
    Error err;
    EXPECT_FALSE(m_acm.HandleHostMessage("acm:engine_ready", "", &err));
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);
    EXPECT_TRUE(m_host.sent.empty());
}

TEST_F(AddonLibraryTest, CustomSignalWithVoidPayloadHasNoData) {
    std::vector<Signals::CustomSignalEmittedEvent> seen;
    m_acm.Events().OnCustomSignalEmitted.Subscribe(
        [&seen](const Signals::CustomSignalEmittedEvent& e) { seen.push_back(e); });

    ASSERT_TRUE(m_acm.HandleHostMessage("ACM:SIGNAL.ACME_TOOLS.RELOAD", "void"));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].addonId, "acme_tools");
    EXPECT_EQ(seen[0].emitterId, "reload");
    EXPECT_FALSE(seen[0].data.has_value());
}

TEST_F(AddonLibraryTest, CustomSignalParsesJsonPayload) {
    std::optional<Json> data;
    m_acm.Events().OnCustomSignalEmitted.Subscribe(
        [&data](const Signals::CustomSignalEmittedEvent& e) { data = e.data; });

    ASSERT_TRUE(m_acm.HandleHostMessage("ACM:SIGNAL.ACME_TOOLS.SCORE", R"({"points":12})"));
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ((*data)["points"], 12);
}

TEST_F(AddonLibraryTest, MalformedCustomSignalsAreDropped) {
    int calls = 0;
    m_acm.Events().OnCustomSignalEmitted.Subscribe([&calls](const Signals::CustomSignalEmittedEvent&) { ++calls; });

    Error err;
    EXPECT_FALSE(m_acm.HandleHostMessage("ACM:SIGNAL.ONLYADDON", "void", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);

    err.Clear();
    EXPECT_FALSE(m_acm.HandleHostMessage("ACM:SIGNAL.A.B", "{oops", &err));
    EXPECT_EQ(err.code, ErrorCode::ParseError);

    EXPECT_EQ(calls, 0);
}

TEST_F(AddonLibraryTest, ExtensionTriggerResolvesActor) {
    Init();
    m_host.actors["p1"] = Actor{ "p1", "Steve" };

    std::optional<Signals::ExtensionTriggeredEvent> seen;
    m_acm.Events().OnExtensionTriggered.Subscribe(
        [&seen](const Signals::ExtensionTriggeredEvent& e) { seen = e; });

    ASSERT_TRUE(m_acm.HandleHostMessage("acm:ext_vxl_ores", R"({"playerId":"p1","extensionId":"menu"})"));

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->extensionId, "menu");
    EXPECT_EQ(seen->actor, (Actor{ "p1", "Steve" }));
}

TEST_F(AddonLibraryTest, ExtensionTriggerIgnoredUnlessAddressedAndDeclared) {
    Init();
    m_host.actors["p1"] = Actor{ "p1", "Steve" };
    int calls = 0;
    m_acm.Events().OnExtensionTriggered.Subscribe([&calls](const Signals::ExtensionTriggeredEvent&) { ++calls; });

    // Another addon's address
    EXPECT_TRUE(m_acm.HandleHostMessage("acm:ext_acme_tools", R"({"playerId":"p1","extensionId":"menu"})"));
    // Undeclared extension
    EXPECT_TRUE(m_acm.HandleHostMessage("acm:ext_vxl_ores", R"({"playerId":"p1","extensionId":"radar"})"));
    // Unknown actor
    EXPECT_TRUE(m_acm.HandleHostMessage("acm:ext_vxl_ores", R"({"playerId":"p9","extensionId":"menu"})"));
    // Empty message
    EXPECT_TRUE(m_acm.HandleHostMessage("acm:ext_vxl_ores", ""));

    EXPECT_EQ(calls, 0);
}

TEST_F(AddonLibraryTest, ExtensionTriggerIgnoredWithoutDeclaredExtensions) {
    AddonData data = MakeAddon();
    data.extensions.reset();
    Init(data);
    m_host.actors["p1"] = Actor{ "p1", "Steve" };

    int calls = 0;
    m_acm.Events().OnExtensionTriggered.Subscribe([&calls](const Signals::ExtensionTriggeredEvent&) { ++calls; });
    EXPECT_TRUE(m_acm.HandleHostMessage("acm:ext_vxl_ores", R"({"playerId":"p1","extensionId":"menu"})"));
    EXPECT_EQ(calls, 0);
}

TEST_F(AddonLibraryTest, ExtensionTriggerWithBadPayloadIsReported) {
    Init();

    Error err;
    EXPECT_FALSE(m_acm.HandleHostMessage("acm:ext_vxl_ores", "not json", &err));
    EXPECT_EQ(err.code, ErrorCode::ParseError);

    err.Clear();
    EXPECT_FALSE(m_acm.HandleHostMessage("acm:ext_vxl_ores", R"({"playerId":"p1"})", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);
}

TEST_F(AddonLibraryTest, ExtensionTriggerBeforeInitIsUninitialized) {
    Error err;
    EXPECT_FALSE(m_acm.HandleHostMessage("acm:ext_vxl_ores", "{}", &err));
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);
}

TEST_F(AddonLibraryTest, UnrelatedMessagesAreIgnored) {
    Error err;
    EXPECT_TRUE(m_acm.HandleHostMessage("minecraft:weather", "rain", &err));
    EXPECT_FALSE(err.HasError());
}

// ============================================================================
// Outbound messages
// ============================================================================

TEST_F(AddonLibraryTest, EmitBroadcastsUpperCasedSignal) {
    Init();

    ASSERT_TRUE(m_acm.Emit("reload"));
    ASSERT_TRUE(m_acm.Emit("score", Json{ { "points", 3 } }));
    ASSERT_TRUE(m_acm.Emit("nothing", Json(nullptr)));

    ASSERT_EQ(m_host.sent.size(), 3u);
    EXPECT_EQ(m_host.sent[0], std::make_pair(std::string("ACM:SIGNAL.VXL_ORES.RELOAD"), std::string("void")));
    EXPECT_EQ(m_host.sent[1], std::make_pair(std::string("ACM:SIGNAL.VXL_ORES.SCORE"), std::string(R"({"points":3})")));
    EXPECT_EQ(m_host.sent[2].second, "void");
}

TEST_F(AddonLibraryTest, EmitBeforeInitIsUninitialized) {
    Error err;
    EXPECT_FALSE(m_acm.Emit("reload", std::nullopt, &err));
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);
    EXPECT_TRUE(m_host.sent.empty());
}

TEST_F(AddonLibraryTest, EmittedSignalReachesAnotherAddon) {
    Init();
    Signals::SignalHub otherHub;
    FakeHostRuntime otherHost;
    AddonLibrary other(m_store, otherHost, otherHub);

    std::optional<Signals::CustomSignalEmittedEvent> seen;
    other.Events().OnCustomSignalEmitted.Subscribe(
        [&seen](const Signals::CustomSignalEmittedEvent& e) { seen = e; });

    ASSERT_TRUE(m_acm.Emit("Ping", Json::array({ 1, 2 })));
    ASSERT_EQ(m_host.sent.size(), 1u);
    ASSERT_TRUE(other.HandleHostMessage(m_host.sent[0].first, m_host.sent[0].second));

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->addonId, "vxl_ores");
    EXPECT_EQ(seen->emitterId, "ping");
    ASSERT_TRUE(seen->data.has_value());
    EXPECT_EQ(*seen->data, Json::array({ 1, 2 }));
}

TEST_F(AddonLibraryTest, FormRequestsCarryActor) {
    Init();
    const Actor steve{ "p1", "Steve" };

    m_acm.ShowHomeForm(steve);
    ASSERT_TRUE(m_acm.ShowAddonForm(steve));

    ASSERT_EQ(m_host.sent.size(), 2u);
    EXPECT_EQ(m_host.sent[0], std::make_pair(std::string("acm:hud_home"), std::string("p1")));
    EXPECT_EQ(m_host.sent[1].first, "acm:hud_addon");

    const Json request = Json::parse(m_host.sent[1].second);
    EXPECT_EQ(request["playerId"], "p1");
    EXPECT_EQ(request["addonData"], MakeAddon().ToJson());
}

// ============================================================================
// Log ledger
// ============================================================================

TEST_F(AddonLibraryTest, LogRequiresLogLedger) {
    Error err;
    EXPECT_FALSE(m_acm.Log("hello", &err));
    EXPECT_EQ(err.code, ErrorCode::NotFound);
    EXPECT_EQ(err.message, "Log database not found");
}

TEST_F(AddonLibraryTest, LogAppendsNumberedEntries) {
    auto ledger = m_store.CreateNamed("ACM:LOG");
    ASSERT_NE(ledger, nullptr);

    ASSERT_TRUE(m_acm.Log("hello"));
    ASSERT_TRUE(m_acm.Log("world"));

    const std::vector<Ledger::LedgerEntry> expected{ { "1: hello", 1 }, { "2: world", 2 } };
    EXPECT_EQ(ledger->ListEntries(), expected);
}

TEST_F(AddonLibraryTest, LogSucceedsAfterEarlierFailureInSameError) {
    Error err;
    EXPECT_FALSE(m_acm.Log("lost", &err));
    EXPECT_EQ(err.code, ErrorCode::NotFound);

    auto ledger = m_store.CreateNamed("ACM:LOG");
    ASSERT_NE(ledger, nullptr);
    EXPECT_TRUE(m_acm.Log("kept", &err));

    const std::vector<Ledger::LedgerEntry> expected{ { "1: kept", 1 } };
    EXPECT_EQ(ledger->ListEntries(), expected);
}

// ============================================================================
// Settings
// ============================================================================

TEST_F(AddonLibraryTest, SettingsEmptyBeforeInit) {
    EXPECT_EQ(m_acm.LoadSettingsData(), Json::object());
}

TEST_F(AddonLibraryTest, FlatSettingsResolveLabelsToValues) {
    Init();
    StoreSettings("ACM:VXL_ORES", R"([
        {"label":"Enabled","value":true},
        {"label":"Mode","options":["easy","hard"],"valueIndex":1},
        {"label":"Name","placeholder":"Type here"}
    ])");

    const Json expected = { { "Enabled", true }, { "Mode", "hard" }, { "Name", nullptr } };
    EXPECT_EQ(m_acm.LoadSettingsData(), expected);
}

TEST_F(AddonLibraryTest, FlatSettingsWithoutLedgerAreEmpty) {
    Init();
    EXPECT_EQ(m_acm.LoadSettingsData(), Json::object());
}

TEST_F(AddonLibraryTest, CategorySettingsUsePerCategoryLedgers) {
    Init(MakeCategoryAddon());
    StoreSettings("ACM:VXL_ORES_GENERAL", R"([{"label":"Enabled","value":false}])");

    const Json expected = {
        { "General", { { "Enabled", false } } },
        { "Audio", Json::object() },
    };
    EXPECT_EQ(m_acm.LoadSettingsData(), expected);
}

TEST_F(AddonLibraryTest, CorruptSettingsBlobIsReported) {
    Init();
    StoreSettings("ACM:VXL_ORES", "[{broken");

    Error err;
    EXPECT_EQ(m_acm.LoadSettingsData(&err), Json::object());
    EXPECT_EQ(err.code, ErrorCode::ParseError);
}

TEST_F(AddonLibraryTest, NotifySettingsChangedPublishesResolvedSettings) {
    Init();
    StoreSettings("ACM:VXL_ORES", R"([{"label":"Enabled","value":true}])");

    std::optional<Signals::SettingsChangedEvent> seen;
    m_acm.Events().OnSettingsChanged.Subscribe([&seen](const Signals::SettingsChangedEvent& e) { seen = e; });

    ASSERT_TRUE(m_acm.NotifySettingsChanged(Actor{ "p1", "Steve" }));
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->settingsData, (Json{ { "Enabled", true } }));
    ASSERT_TRUE(seen->actor.has_value());
    EXPECT_EQ(seen->actor->id, "p1");
}

TEST_F(AddonLibraryTest, NotifySettingsChangedBeforeInitIsUninitialized) {
    Error err;
    EXPECT_FALSE(m_acm.NotifySettingsChanged(std::nullopt, &err));
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);
}

// ============================================================================
// File system binding
// ============================================================================

TEST_F(AddonLibraryTest, FileSystemIsBoundToAddonIdentity) {
    Error err;
    EXPECT_FALSE(m_acm.Fs().New("logs", false, &err).has_value());
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);

    Init();
    auto logs = m_acm.Fs().New("logs");
    ASSERT_TRUE(logs.has_value());
    EXPECT_EQ(logs->DbId(), "ACM:FS.VXL_ORES.LOGS");
    EXPECT_TRUE(logs->IsOwner());
}

// ============================================================================
// Host interaction
// ============================================================================

TEST(AddonLibraryHostTest, ExtensionTriggerLooksUpActorOnce) {
    using ::testing::_;
    using ::testing::Return;

    Ledger::MemoryLedgerStore store;
    Signals::SignalHub hub;
    ::testing::StrictMock<MockHostRuntime> host;
    AddonLibrary acm(store, host, hub);
    ASSERT_TRUE(acm.InitAddon(MakeAddon()));

    EXPECT_CALL(host, FindActor("p1")).WillOnce(Return(Actor{ "p1", "Steve" }));
    EXPECT_CALL(host, SendBroadcast(_, _)).Times(0);

    int calls = 0;
    hub.OnExtensionTriggered.Subscribe([&calls](const Signals::ExtensionTriggeredEvent&) { ++calls; });
    ASSERT_TRUE(acm.HandleHostMessage("acm:ext_vxl_ores", R"({"playerId":"p1","extensionId":"menu"})"));
    EXPECT_EQ(calls, 1);
}

TEST(AddonLibraryHostTest, UndeclaredExtensionNeverQueriesHost) {
    Ledger::MemoryLedgerStore store;
    Signals::SignalHub hub;
    ::testing::StrictMock<MockHostRuntime> host;
    AddonLibrary acm(store, host, hub);
    ASSERT_TRUE(acm.InitAddon(MakeAddon()));

    EXPECT_CALL(host, FindActor(::testing::_)).Times(0);
    EXPECT_TRUE(acm.HandleHostMessage("acm:ext_vxl_ores", R"({"playerId":"p1","extensionId":"radar"})"));
}

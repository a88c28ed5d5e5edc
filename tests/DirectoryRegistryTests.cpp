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

#include "../src/FileSystem/DirectoryRegistry.hpp"
#include "../src/Ledger/MemoryLedgerStore.hpp"

using namespace AddonKit;
using namespace AddonKit::FileSystem;

class DirectoryRegistryTest : public ::testing::Test {
protected:
    DirectoryRegistry Registry(std::optional<std::string> identity, RegistryOptions options = {}) {
        return DirectoryRegistry(m_store, [identity]() { return identity; }, std::move(options));
    }

    Ledger::MemoryLedgerStore m_store;
};

TEST_F(DirectoryRegistryTest, FormatUpperCasesIdentityAndName) {
    auto fs = Registry(std::string("vxl_Ores"));
    EXPECT_EQ(fs.Format("logs"), std::optional<std::string>("ACM:FS.VXL_ORES.LOGS"));
}

TEST_F(DirectoryRegistryTest, FormatUsesConfiguredRoot) {
    RegistryOptions options;
    options.rootNamespace = "HOST:DATA";
    auto fs = Registry(std::string("a_b"), options);
    EXPECT_EQ(fs.Format("cache"), std::optional<std::string>("HOST:DATA.A_B.CACHE"));
}

TEST_F(DirectoryRegistryTest, EveryOperationNeedsIdentity) {
    auto fs = Registry(std::nullopt);

    Error err;
    EXPECT_FALSE(fs.Format("logs", &err).has_value());
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);

    err.Clear();
    EXPECT_FALSE(fs.IsValid("logs", &err));
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);

    err.Clear();
    EXPECT_FALSE(fs.New("logs", false, &err).has_value());
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);

    err.Clear();
    EXPECT_FALSE(fs.Get("logs", &err).has_value());
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);

    err.Clear();
    EXPECT_FALSE(fs.Delete("logs", &err));
    EXPECT_EQ(err.code, ErrorCode::Uninitialized);

    EXPECT_TRUE(m_store.ListNames().empty());
}

TEST_F(DirectoryRegistryTest, NewCreatesBackingLedger) {
    auto fs = Registry(std::string("vxl_ores"));
    EXPECT_FALSE(fs.IsValid("logs"));

    Error err;
    auto dir = fs.New("logs", false, &err);
    ASSERT_TRUE(dir.has_value()) << err.message;
    EXPECT_EQ(dir->DbId(), "ACM:FS.VXL_ORES.LOGS");
    EXPECT_EQ(dir->OwnerId(), "VXL_ORES");
    EXPECT_TRUE(dir->IsOwner());
    EXPECT_TRUE(fs.IsValid("logs"));
    EXPECT_NE(m_store.GetNamed("ACM:FS.VXL_ORES.LOGS"), nullptr);
}

TEST_F(DirectoryRegistryTest, NewTwiceReturnsSameBackingLedger) {
    auto fs = Registry(std::string("vxl_ores"));

    auto first = fs.New("logs");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->Write("entry", Json(1)));

    Error err;
    auto second = fs.New("logs", true, &err);
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(err.HasError());
    EXPECT_EQ(second->DbId(), first->DbId());
    EXPECT_TRUE(second->Exists("entry"));
    EXPECT_EQ(m_store.ListNames().size(), 1u);
}

TEST_F(DirectoryRegistryTest, GetDoesNotCreate) {
    auto fs = Registry(std::string("vxl_ores"));

    Error err;
    EXPECT_FALSE(fs.Get("logs", &err).has_value());
    EXPECT_FALSE(err.HasError());
    EXPECT_TRUE(m_store.ListNames().empty());
}

TEST_F(DirectoryRegistryTest, DeleteThenGetIsAbsent) {
    auto fs = Registry(std::string("vxl_ores"));
    ASSERT_TRUE(fs.New("logs").has_value());

    ASSERT_TRUE(fs.Delete("logs"));
    EXPECT_FALSE(fs.Get("logs").has_value());
    EXPECT_FALSE(fs.IsValid("logs"));
}

TEST_F(DirectoryRegistryTest, DeleteMissingFailsWithNotFound) {
    auto fs = Registry(std::string("vxl_ores"));

    Error err;
    EXPECT_FALSE(fs.Delete("logs", &err));
    EXPECT_EQ(err.code, ErrorCode::NotFound);
    EXPECT_EQ(err.message, "Directory logs does not exist");
}

TEST_F(DirectoryRegistryTest, DirectoriesAreScopedPerIdentity) {
    auto mine = Registry(std::string("vxl_ores"));
    auto theirs = Registry(std::string("acme_tools"));

    ASSERT_TRUE(mine.New("shared").has_value());
    EXPECT_FALSE(theirs.IsValid("shared"));
    EXPECT_EQ(theirs.Format("shared"), std::optional<std::string>("ACM:FS.ACME_TOOLS.SHARED"));
}

TEST_F(DirectoryRegistryTest, ForeignLedgerIsReadableButNotWritable) {
    auto mine = Registry(std::string("vxl_ores"));
    auto dir = mine.New("logs");
    ASSERT_TRUE(dir.has_value());
    ASSERT_TRUE(dir->Write("a", Json("mine")));

    // Another addon wrapping the same ledger is not its owner.
    Directory foreign(m_store.GetNamed("ACM:FS.VXL_ORES.LOGS"), "ACME_TOOLS");
    EXPECT_FALSE(foreign.IsOwner());
    EXPECT_EQ(foreign.Read("a").value_or(Json()), Json("mine"));
    EXPECT_TRUE(foreign.Write("a", Json("theirs")));
    EXPECT_EQ(dir->Read("a").value_or(Json()), Json("mine"));
}

TEST_F(DirectoryRegistryTest, StrictOwnershipPropagatesToDirectories) {
    RegistryOptions options;
    options.directory.strictOwnership = true;
    auto fs = Registry(std::string("vxl_ores"), options);

    auto dir = fs.New("logs");
    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(dir->Write("a", Json(1)));
}

TEST_F(DirectoryRegistryTest, EarlierFailureInReusedErrorDoesNotBlockLaterCalls) {
    auto fs = Registry(std::string("vxl_ores"));

    Error err;
    EXPECT_FALSE(fs.Delete("missing", &err));
    EXPECT_EQ(err.code, ErrorCode::NotFound);

    auto dir = fs.New("logs", false, &err);
    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(fs.IsValid("logs"));

    EXPECT_TRUE(fs.Delete("logs", &err));
    EXPECT_FALSE(fs.IsValid("logs"));
}

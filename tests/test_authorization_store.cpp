#include <gtest/gtest.h>
#include <managers/authorization_store.hpp>
#include <fstream>
#include <type_traits>
#include <unistd.h>

class AuthorizationStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("fleetctl_auth_" + std::to_string(::getpid()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
        path = dir / "operators.yaml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    fs::path path;
};

TEST_F(AuthorizationStoreTest, MissingFileIsEmpty) {
    AuthorizationStore store(path);
    EXPECT_TRUE(store.list().empty());
    EXPECT_FALSE(store.is_authorized("10001"));
}

TEST_F(AuthorizationStoreTest, AddPersists) {
    {
        AuthorizationStore store(path);
        ASSERT_TRUE(store.add("10001").is_ok());
        ASSERT_TRUE(store.add("alice").is_ok());
    }

    AuthorizationStore reopened(path);
    EXPECT_TRUE(reopened.is_authorized("10001"));
    EXPECT_TRUE(reopened.is_authorized("alice"));
    EXPECT_EQ(reopened.list().size(), 2u);
}

TEST_F(AuthorizationStoreTest, DigitIdsStayStrings) {
    AuthorizationStore store(path);
    ASSERT_TRUE(store.add("007").is_ok());
    AuthorizationStore reopened(path);
    EXPECT_TRUE(reopened.is_authorized("007"));
}

TEST_F(AuthorizationStoreTest, DuplicateAndEmptyRejected) {
    AuthorizationStore store(path);
    ASSERT_TRUE(store.add("10001").is_ok());
    EXPECT_TRUE(store.add("10001").is_err());
    EXPECT_TRUE(store.add("").is_err());
    EXPECT_EQ(store.list().size(), 1u);
}

TEST_F(AuthorizationStoreTest, RemoveExisting) {
    AuthorizationStore store(path);
    ASSERT_TRUE(store.add("10001").is_ok());
    ASSERT_TRUE(store.remove("10001").is_ok());
    EXPECT_FALSE(store.is_authorized("10001"));
    EXPECT_TRUE(store.remove("10001").is_err());
}

TEST_F(AuthorizationStoreTest, CorruptFileTreatedAsEmpty) {
    {
        std::ofstream out(path);
        out << "authorized: [unclosed\n";
    }
    AuthorizationStore store(path);
    EXPECT_TRUE(store.list().empty());
}

// The file location always comes from the caller (ServiceDeps or ~/.fleetctl)
TEST(AuthorizationStoreApi, PathIsAlwaysExplicit) {
    EXPECT_FALSE(std::is_default_constructible<AuthorizationStore>::value);
    EXPECT_TRUE((std::is_constructible<AuthorizationStore, fs::path>::value));
}

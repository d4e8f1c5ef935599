#include <gtest/gtest.h>
#include "state/StateStore.hpp"
#include "fakes.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace fdrop;
using namespace fdrop::types;

class JsonFileStateStoreTest : public ::testing::Test {
protected:
    test::TempDir dir{"fastdrop_state"};
    std::filesystem::path file = dir.path() / "nested" / "config.json";

    [[nodiscard]] nlohmann::json readBack() const {
        std::ifstream in(file);
        return nlohmann::json::parse(in);
    }

    [[nodiscard]] std::string rawText() const {
        std::ifstream in(file);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(JsonFileStateStoreTest, MissingFileLoadsDefaults) {
    const state::JsonFileStateStore store(file);
    const auto s = store.load();

    EXPECT_FALSE(s.googleCredentials.has_value());
    EXPECT_FALSE(s.autoStart);
    EXPECT_FALSE(s.autoCopy);
    EXPECT_FALSE(s.provider.has_value());
}

TEST_F(JsonFileStateStoreTest, CorruptFileLoadsDefaults) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file) << "{ this is not json";

    const state::JsonFileStateStore store(file);
    const auto s = store.load();
    EXPECT_FALSE(s.googleCredentials.has_value());
    EXPECT_FALSE(s.autoCopy);
}

TEST_F(JsonFileStateStoreTest, FirstWriteCreatesParentDirectory) {
    state::JsonFileStateStore store(file);
    store.update([](state::PersistedState& s) { s.autoCopy = true; });

    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_TRUE(store.load().autoCopy);
    EXPECT_EQ(readBack().at("autoCopy"), true);
}

TEST_F(JsonFileStateStoreTest, WritesPrettyPrintedRecord) {
    state::JsonFileStateStore store(file);
    store.update([](state::PersistedState& s) {
        s.googleCredentials = Credentials{"id", "secret"};
        s.provider = ProviderKind::CredentialedCloudStore;
    });

    const auto j = readBack();
    EXPECT_EQ(j.at("googleCredentials").at("clientId"), "id");
    EXPECT_EQ(j.at("googleCredentials").at("clientSecret"), "secret");
    EXPECT_EQ(j.at("provider"), "cloud");
    EXPECT_EQ(j.at("autoStart"), false);
    EXPECT_NE(rawText().find("\n  \""), std::string::npos);
}

TEST_F(JsonFileStateStoreTest, UnknownKeysSurviveUpdates) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file) << R"({"windowBounds": {"w": 800, "h": 600}, "autoStart": true})";

    state::JsonFileStateStore store(file);
    store.update([](state::PersistedState& s) { s.autoCopy = true; });

    const auto j = readBack();
    EXPECT_EQ(j.at("windowBounds").at("w"), 800);
    EXPECT_EQ(j.at("autoStart"), true);
    EXPECT_EQ(j.at("autoCopy"), true);
}

TEST_F(JsonFileStateStoreTest, WrongTypesFallBackToDefaults) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file) << R"({"autoCopy": "yes", "googleCredentials": {"clientId": "only-id"}, "provider": "ftp"})";

    const state::JsonFileStateStore store(file);
    const auto s = store.load();
    EXPECT_FALSE(s.autoCopy);
    EXPECT_FALSE(s.googleCredentials.has_value());
    EXPECT_FALSE(s.provider.has_value());
}

TEST_F(JsonFileStateStoreTest, UpdateOnUnwritableLocationThrows) {
    const auto blocker = dir.writeFile("blocker", "regular file");
    state::JsonFileStateStore store(blocker / "config.json");

    EXPECT_THROW(store.update([](state::PersistedState& s) { s.autoCopy = true; }), std::exception);
    EXPECT_FALSE(store.load().autoCopy);
}

TEST_F(JsonFileStateStoreTest, RejectedValuesSurviveUnrelatedWrites) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file) << R"({"googleCredentials": {"clientId": "only-id"}, "provider": "ftp"})";

    state::JsonFileStateStore store(file);
    store.update([](state::PersistedState& s) { s.autoCopy = true; });

    const auto j = readBack();
    EXPECT_EQ(j.at("googleCredentials").at("clientId"), "only-id");
    EXPECT_FALSE(j.at("googleCredentials").contains("clientSecret"));
    EXPECT_EQ(j.at("provider"), "ftp");
    EXPECT_EQ(j.at("autoCopy"), true);
}

TEST_F(JsonFileStateStoreTest, RejectedValueIsReplacedWhenSetExplicitly) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file) << R"({"googleCredentials": {"clientId": 42, "clientSecret": "s"}, "provider": "ftp"})";

    state::JsonFileStateStore store(file);
    EXPECT_FALSE(store.load().googleCredentials.has_value());

    store.update([](state::PersistedState& s) {
        s.googleCredentials = Credentials{"id", "secret"};
        s.provider = ProviderKind::AnonymousHost;
    });

    const auto loaded = store.load();
    ASSERT_TRUE(loaded.googleCredentials.has_value());
    EXPECT_EQ(loaded.googleCredentials->clientId, "id");
    EXPECT_EQ(readBack().at("provider"), "anonymous");
}

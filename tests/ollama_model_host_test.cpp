#include <models/model_host.hpp>
#include <models/ollama_backend_config.hpp>
#include <models/ollama_model_host.hpp>
#include <network/bridge_config.hpp>

#include <ollama/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace Testing {

class OllamaModelHostTest : public ::testing::Test
{
  public:
    inline static const std::vector<std::string> kInstalled = {
      "llama3.2:3b", "qwen2.5-coder:7b", "llama3.2:1b", "mistral", "llama3.2-vision:11b"};
};

TEST_F(OllamaModelHostTest, FamilyIsNameUpToTag)
{
    EXPECT_EQ(COllamaModelHost::FamilyOf("llama3.2:3b"), "llama3.2");
    EXPECT_EQ(COllamaModelHost::FamilyOf("mistral"), "mistral");
    EXPECT_EQ(COllamaModelHost::FamilyOf("qwen2.5-coder:7b"), "qwen2.5-coder");
}

TEST_F(OllamaModelHostTest, NoFamilyKeepsAll)
{
    EXPECT_EQ(COllamaModelHost::FilterByFamily(kInstalled, std::nullopt), kInstalled);
}

TEST_F(OllamaModelHostTest, FamilyFilterKeepsOrder)
{
    const std::vector<std::string> expected = {"llama3.2:3b", "llama3.2:1b"};
    EXPECT_EQ(COllamaModelHost::FilterByFamily(kInstalled, std::string("llama3.2")), expected);
}

TEST_F(OllamaModelHostTest, FullNameMatches)
{
    const std::vector<std::string> expected = {"qwen2.5-coder:7b"};
    EXPECT_EQ(COllamaModelHost::FilterByFamily(kInstalled, std::string("qwen2.5-coder:7b")),
              expected);
}

TEST_F(OllamaModelHostTest, UnknownFamilyGivesNothing)
{
    EXPECT_TRUE(COllamaModelHost::FilterByFamily(kInstalled, std::string("gpt-4o")).empty());
}

TEST_F(OllamaModelHostTest, ChatJsonCarriesMessagesAndOptions)
{
    const TChatMessages messages = {{EChatRole::User, "Write a haiku"},
                                    {EChatRole::Assistant, "Code flows"},
                                    {EChatRole::User, "More"}};
    const auto options = nlohmann::json::parse(R"({"temperature": 0.5})");

    const auto js = COllamaModelHost::BuildChatJson("llama3.2:3b", messages, options);
    EXPECT_EQ(js["model"], "llama3.2:3b");
    EXPECT_EQ(js["stream"], true);
    ASSERT_EQ(js["messages"].size(), 3u);
    EXPECT_EQ(js["messages"][0]["role"], "user");
    EXPECT_EQ(js["messages"][0]["content"], "Write a haiku");
    EXPECT_EQ(js["messages"][1]["role"], "assistant");
    EXPECT_EQ(js["options"]["temperature"], 0.5);
}

TEST_F(OllamaModelHostTest, EmptyOptionsAreNotSent)
{
    const auto js = COllamaModelHost::BuildChatJson("mistral", {{EChatRole::User, "hi"}},
                                                    nlohmann::json::object());
    EXPECT_FALSE(js.contains("options"));
}

TEST_F(OllamaModelHostTest, FragmentFromResponse)
{
    const auto js = nlohmann::json::parse(
      R"({"created_at":"2025-04-26T12:13:59.246926495Z","done":false,
          "message":{"content":"0","role":"assistant"},"model":"qwen2.5-coder:7b"})");
    EXPECT_EQ(COllamaModelHost::ExtractFragment(js), "0");
    ASSERT_TRUE(COllamaModelHost::IsModelDone(js).has_value());
    EXPECT_FALSE(*COllamaModelHost::IsModelDone(js));
}

TEST_F(OllamaModelHostTest, FinalResponse)
{
    const auto js =
      nlohmann::json::parse(R"({"done":true,"message":{"content":"","role":"assistant"}})");
    EXPECT_EQ(COllamaModelHost::ExtractFragment(js), "");
    EXPECT_EQ(COllamaModelHost::IsModelDone(js), std::optional<bool>(true));
}

TEST_F(OllamaModelHostTest, BrokenResponseHasNoFragment)
{
    EXPECT_EQ(COllamaModelHost::ExtractFragment(nlohmann::json::parse(R"({"message": 5})")), "");
    EXPECT_EQ(COllamaModelHost::ExtractFragment(nlohmann::json::parse(R"({})")), "");
    EXPECT_FALSE(
      COllamaModelHost::IsModelDone(nlohmann::json::parse(R"({"done": "yes"})")).has_value());
}

TEST_F(OllamaModelHostTest, OtherVendorIsNotServed)
{
    TOllamaBackendConfig config;
    config.vendor = "ollama";
    COllamaModelHost host(config);
    // Different vendor must not even touch Ollama.
    EXPECT_TRUE(host.SelectChatModels({"copilot", std::nullopt}).empty());
}

TEST_F(OllamaModelHostTest, ConfigValidation)
{
    TOllamaBackendConfig config;
    EXPECT_TRUE(config.Validate());
    EXPECT_EQ(config.CreateOllamaUrl(), "http://localhost:11434");

    config.ollamaHost = "bad host";
    EXPECT_FALSE(config.Validate());
    EXPECT_THROW(COllamaModelHost{config}, std::invalid_argument);

    config.ollamaHost = "localhost";
    config.ollamaPort = 0;
    EXPECT_FALSE(config.Validate());

    config.ollamaPort = 11434;
    config.vendor.clear();
    EXPECT_FALSE(config.Validate());
}

TEST_F(OllamaModelHostTest, BridgeConfigValidation)
{
    TBridgeConfig config;
    EXPECT_TRUE(config.Validate());
    EXPECT_EQ(config.CreateBaseUrl(3000), "http://127.0.0.1:3000");

    config.listenPort = 0;
    EXPECT_TRUE(config.Validate());
    config.listenPort = 70000; // NOLINT
    EXPECT_FALSE(config.Validate());

    config.listenPort = 3000;
    config.chatPath = "chat";
    EXPECT_FALSE(config.Validate());

    config.chatPath = "/chat";
    config.listenHost = "local host";
    EXPECT_FALSE(config.Validate());
}

TEST_F(OllamaModelHostTest, VerbosityLevels)
{
    TBridgeConfig config;
    config.verbosity = EBridgeVerbosity::Warning;
    EXPECT_TRUE(config.IsFittingVerbosity(EBridgeVerbosity::Error));
    EXPECT_TRUE(config.IsFittingVerbosity(EBridgeVerbosity::Warning));
    EXPECT_FALSE(config.IsFittingVerbosity(EBridgeVerbosity::Info));
    EXPECT_FALSE(config.IsFittingVerbosity(EBridgeVerbosity::Debug));

    config.verbosity = EBridgeVerbosity::Silent;
    bool called = false;
    config.ExecIfFittingVerbosity(EBridgeVerbosity::Error, [&called](auto &) {
        called = true;
    });
    EXPECT_FALSE(called);
}

} // namespace Testing

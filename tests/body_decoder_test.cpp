#include <network/body_decoder.hpp>
#include <network/bridge_errors.hpp>

#include <ollama/httplib.h>
#include <ollama/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace Testing {

class BodyDecoderTest : public ::testing::Test
{
  public:
    /// @returns Reader which feeds pieces one by one and reports failure at the end if asked.
    static httplib::ContentReader MakeReader(std::vector<std::string> pieces, bool isFailing)
    {
        return httplib::ContentReader(
          [pieces = std::move(pieces), isFailing](const httplib::ContentReceiver &receiver) {
              for (const auto &piece : pieces)
              {
                  if (!receiver(piece.data(), piece.size()))
                  {
                      return false;
                  }
              }
              return !isFailing;
          },
          [](const auto & /*header*/, const auto & /*receiver*/) {
              return false;
          });
    }
};

TEST_F(BodyDecoderTest, JoinsPieces)
{
    CBodyDecoder decoder;
    const std::string first = R"({"prompt": "Wri)";
    const std::string second = R"(te a haiku"})";
    decoder.Append(first.data(), first.size());
    decoder.Append(second.data(), second.size());

    EXPECT_EQ(decoder.CollectedSize(), first.size() + second.size());
    const auto js = decoder.Finish();
    EXPECT_EQ(js["prompt"], "Write a haiku");
}

TEST_F(BodyDecoderTest, EmptyBodyIsMalformed)
{
    CBodyDecoder decoder;
    EXPECT_THROW((void)decoder.Finish(), CMalformedBodyError);
}

TEST_F(BodyDecoderTest, BrokenJsonIsMalformed)
{
    CBodyDecoder decoder;
    const std::string body = R"({"prompt": )";
    decoder.Append(body.data(), body.size());
    try
    {
        (void)decoder.Finish();
        FAIL() << "Exception expected.";
    }
    catch (const CMalformedBodyError &e)
    {
        EXPECT_EQ(std::string(e.what()).rfind("Invalid JSON body: ", 0), 0u);
    }
}

TEST_F(BodyDecoderTest, AppendAfterFinishIsLogicError)
{
    CBodyDecoder decoder;
    const std::string body = "{}";
    decoder.Append(body.data(), body.size());
    EXPECT_TRUE(decoder.Finish().empty());
    EXPECT_THROW(decoder.Append(body.data(), body.size()), std::logic_error);
}

TEST_F(BodyDecoderTest, NonObjectJsonIsDecoded)
{
    CBodyDecoder decoder;
    const std::string body = "[1, 2, 3]";
    decoder.Append(body.data(), body.size());
    EXPECT_TRUE(decoder.Finish().is_array());
}

TEST_F(BodyDecoderTest, DecodesFromContentReader)
{
    const auto js =
      DecodeJsonBody(MakeReader({R"({"prompt":)", R"( "hi", "vendor")", R"(: "copilot"})"}, false));
    EXPECT_EQ(js["prompt"], "hi");
    EXPECT_EQ(js["vendor"], "copilot");
}

TEST_F(BodyDecoderTest, ReaderFailureIsIoError)
{
    EXPECT_THROW((void)DecodeJsonBody(MakeReader({R"({"prompt":)"}, true)), CIoError);
}

TEST_F(BodyDecoderTest, ReaderWithMalformedBody)
{
    EXPECT_THROW((void)DecodeJsonBody(MakeReader({"not json"}, false)), CMalformedBodyError);
}

} // namespace Testing

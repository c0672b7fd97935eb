#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/envelope.hpp>

#include <vector>

#include <gtest/gtest.h>

using namespace kruise::sdk;

TEST(Envelope, Encode)
{
  auto data = envelope::encode("{}", envelope::FLAG_END_STREAM);

  ASSERT_EQ(data.size(), envelope::HEADER_SIZE + 2);
  EXPECT_EQ(data[0], 0x02);
  EXPECT_EQ(data[1], 0);
  EXPECT_EQ(data[2], 0);
  EXPECT_EQ(data[3], 0);
  EXPECT_EQ(data[4], 2);
  EXPECT_EQ(data.substr(envelope::HEADER_SIZE), "{}");

  std::string large(300, 'x');
  auto encoded = envelope::encode(large);
  EXPECT_EQ(static_cast<uint8_t>(encoded[3]), 1);
  EXPECT_EQ(static_cast<uint8_t>(encoded[4]), 44);
}

TEST(Envelope, DecodeArbitrarySplits)
{
  std::string stream = envelope::encode(R"({"event":{"start":{"pid":7}}})") +
                       envelope::encode(R"({"event":{"data":{"stdout":"aGk="}}})") +
                       envelope::encode("", 0) + envelope::encode("{}", envelope::FLAG_END_STREAM);

  for (size_t step : {1, 3, 5, 8, 1000}) {

    envelope::Decoder decoder;
    std::vector<std::pair<uint8_t, std::string>> messages;
    for (size_t pos = 0; pos < stream.size(); pos += step) {
      decoder.feed(std::string_view{stream}.substr(pos, step), [&](uint8_t flags, std::string_view payload) {
        messages.emplace_back(flags, std::string{payload});
      });
    }

    ASSERT_EQ(messages.size(), 4u) << "step " << step;
    EXPECT_EQ(messages[0].second, R"({"event":{"start":{"pid":7}}})");
    EXPECT_EQ(messages[1].second, R"({"event":{"data":{"stdout":"aGk="}}})");
    EXPECT_EQ(messages[2].second, "");
    EXPECT_EQ(messages[3].first, envelope::FLAG_END_STREAM);
    EXPECT_EQ(decoder.pending(), 0u);
  }
}

TEST(Envelope, IncompleteMessage)
{
  auto data = envelope::encode("payload");

  envelope::Decoder decoder;
  int count = 0;
  decoder.feed(std::string_view{data}.substr(0, data.size() - 1), [&](uint8_t, std::string_view) { ++count; });
  EXPECT_EQ(count, 0);
  EXPECT_EQ(decoder.pending(), data.size() - 1);

  decoder.feed(std::string_view{data}.substr(data.size() - 1), [&](uint8_t, std::string_view payload) {
    ++count;
    EXPECT_EQ(payload, "payload");
  });
  EXPECT_EQ(count, 1);
}

TEST(Envelope, Compressed)
{
  envelope::Decoder decoder;
  EXPECT_THROW(
      decoder.feed(envelope::encode("x", envelope::FLAG_COMPRESSED), [](uint8_t, std::string_view) {}),
      kruise::common::KruiseException
  );
}

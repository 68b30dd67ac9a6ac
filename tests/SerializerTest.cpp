#include <gtest/gtest.h>

#include "Serializer.hpp"

namespace fc {
namespace {

TEST(SerializerTest, EscapesQuotesBackslashesAndControls) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("C:\\src\\\"x\".cpp"), "C:\\\\src\\\\\\\"x\\\".cpp");
    EXPECT_EQ(json_escape("a\nb\tc"), "a\\nb\\tc");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(SerializerTest, LocationJson) {
    EXPECT_EQ(make_callsite_json(CallSiteId::fromLocation("a.cpp", 12, 3)),
              "{\"kind\":\"location\",\"file\":\"a.cpp\",\"line\":12,\"column\":3}");
}

TEST(SerializerTest, TokenJson) {
    EXPECT_EQ(make_callsite_json(CallSiteId::fromToken("say \"hi\"")),
              "{\"kind\":\"token\",\"token\":\"say \\\"hi\\\"\"}");
}

TEST(SerializerTest, MessageEnvelope) {
    EXPECT_EQ(make_message_json("PING", "{}"), "{\"type\":\"PING\",\"payload\":{}}");
}

TEST(SerializerTest, MessageTypeIsEscaped) {
    EXPECT_EQ(make_message_json("A\"B", "{}"), "{\"type\":\"A\\\"B\",\"payload\":{}}");
}

} // namespace
} // namespace fc

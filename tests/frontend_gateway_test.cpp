#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fakes.h"
#include "frontend_gateway.h"
#include "realtime_relay.h"

TEST(FrontendParse, RejectsMalformedFrames) {
    EXPECT_FALSE(FrontendGateway::parseText("not json").ok);
    EXPECT_FALSE(FrontendGateway::parseText("[1,2]").ok);
    EXPECT_FALSE(FrontendGateway::parseText("{\"text\":\"no type\"}").ok);
    EXPECT_FALSE(FrontendGateway::parseText("{\"type\":\"\"}").ok);

    ParseResult pr = FrontendGateway::parseText("{oops");
    EXPECT_EQ("invalid JSON", pr.error);
}

TEST(FrontendParse, UserMessage) {
    ParseResult pr = FrontendGateway::parseText(
        R"({"type":"user_message","id":"c1","text":"Hello"})");
    ASSERT_TRUE(pr.ok);
    EXPECT_EQ(KIND_USER_MESSAGE, pr.envelope.kind());
    EXPECT_EQ("c1", pr.envelope.id());
    EXPECT_EQ("Hello", pr.envelope.get("text"));

    ParseResult noId = FrontendGateway::parseText(R"({"type":"user_message","text":"Hi"})");
    ASSERT_TRUE(noId.ok);
    EXPECT_FALSE(noId.envelope.has("id"));
}

TEST(FrontendParse, EmptyUserMessageRejected) {
    EXPECT_FALSE(FrontendGateway::parseText(R"({"type":"user_message","text":""})").ok);
    EXPECT_FALSE(FrontendGateway::parseText(R"({"type":"user_message"})").ok);
}

TEST(FrontendParse, DisconnectBecomesControl) {
    ParseResult pr = FrontendGateway::parseText(R"({"type":"disconnect"})");
    ASSERT_TRUE(pr.ok);
    EXPECT_EQ(KIND_CONTROL, pr.envelope.kind());
    EXPECT_EQ(ACTION_DISCONNECT, pr.envelope.action());
}

TEST(FrontendParse, ControlNeedsAction) {
    EXPECT_FALSE(FrontendGateway::parseText(R"({"type":"control"})").ok);

    ParseResult pr = FrontendGateway::parseText(R"({"type":"control","action":"commit"})");
    ASSERT_TRUE(pr.ok);
    EXPECT_EQ(ACTION_COMMIT, pr.envelope.action());
}

TEST(FrontendParse, OtherTypesKeepTheirFields) {
    ParseResult pr = FrontendGateway::parseText(
        R"({"type":"set_voice","voice":"ash","loud":true,"count":3})");
    ASSERT_TRUE(pr.ok);
    EXPECT_EQ(KIND_CONTROL, pr.envelope.kind());
    EXPECT_EQ("set_voice", pr.envelope.action());
    EXPECT_EQ("ash", pr.envelope.get("voice"));
    EXPECT_TRUE(pr.envelope.flag("loud"));
    EXPECT_FALSE(pr.envelope.has("count"));
}

class FrontendGatewayTest : public ::testing::Test {
protected:
    FrontendGatewayTest()
        : transport(std::make_shared<FakeFrontendTransport>()),
          router("frontend"),
          gateway(transport, router, "sess_test", log)
    {
        router.registerHandler(KIND_AUDIO, [this](const Envelope &e) { received.push_back(e); });
        router.registerHandler(KIND_USER_MESSAGE, [this](const Envelope &e) { received.push_back(e); });
        router.registerHandler(KIND_CONTROL, [this](const Envelope &e) { received.push_back(e); });
    }

    LogConfig                               log;
    std::shared_ptr<FakeFrontendTransport>  transport;
    MessageRouter                           router;
    FrontendGateway                         gateway;
    std::vector<Envelope>                   received;
};

TEST_F(FrontendGatewayTest, BinaryFramesBecomeAudio) {
    gateway.startReading([](const std::string &) {});
    transport->deliverBinary(std::vector<uint8_t>(640, 3));

    ASSERT_EQ(1u, received.size());
    EXPECT_TRUE(received[0].isAudio());
    EXPECT_EQ(640u, received[0].pcm().size());
}

TEST_F(FrontendGatewayTest, TextFramesAreParsedAndDispatched) {
    gateway.startReading([](const std::string &) {});
    transport->deliverText(R"({"type":"user_message","text":"Hi"})");
    transport->deliverText("garbage");
    transport->deliverText(R"({"type":"disconnect"})");

    ASSERT_EQ(2u, received.size());
    EXPECT_EQ(KIND_USER_MESSAGE, received[0].kind());
    EXPECT_EQ(ACTION_DISCONNECT, received[1].action());
}

TEST_F(FrontendGatewayTest, SendsAudioAsBinaryAndTheRestAsJson) {
    gateway.send(Envelope::audio(std::vector<uint8_t>(960, 1)));
    gateway.send(Envelope::control(ACTION_CLEAR));

    ASSERT_EQ(1u, transport->binaries().size());
    EXPECT_EQ(960u, transport->binaries()[0].size());
    EXPECT_EQ(1u, transport->countAction(ACTION_CLEAR));
}

TEST_F(FrontendGatewayTest, FunctionCallsNeverLeave) {
    Envelope call(KIND_FUNCTION_CALL);
    call.set("name", "get_current_time");
    gateway.send(call);
    EXPECT_TRUE(transport->texts().empty());
}

TEST_F(FrontendGatewayTest, SendAfterCloseThrows) {
    EXPECT_TRUE(gateway.close(std::chrono::milliseconds(100)));
    EXPECT_EQ(1000, transport->closeCode());
    EXPECT_FALSE(gateway.isOpen());
    EXPECT_THROW(gateway.send(Envelope::error("late")), ConnectionClosed);
}

TEST_F(FrontendGatewayTest, PeerCloseReachesHandler) {
    std::string why;
    gateway.startReading([&](const std::string &reason) { why = reason; });
    transport->peerClose("going away");
    EXPECT_EQ("going away", why);
}

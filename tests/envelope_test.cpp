#include <stdexcept>

#include <gtest/gtest.h>

#include "envelope.h"
#include "json_util.h"

TEST(Envelope, KindNamesRoundTrip) {
    const EnvelopeKind kinds[] = {
        KIND_CONTROL, KIND_USER_MESSAGE, KIND_ASSISTANT_MESSAGE, KIND_TEXT_DELTA,
        KIND_TRANSCRIPTION, KIND_ERROR, KIND_AUDIO, KIND_FUNCTION_CALL
    };
    for (EnvelopeKind k : kinds) {
        EnvelopeKind parsed;
        ASSERT_TRUE(envelopeKindFromName(envelopeKindName(k), parsed));
        EXPECT_EQ(k, parsed);
    }
    EnvelopeKind unused;
    EXPECT_FALSE(envelopeKindFromName("session.update", unused));
}

TEST(Envelope, FactoriesSetFields) {
    Envelope c = Envelope::control("speech_started", "item_1");
    EXPECT_EQ(KIND_CONTROL, c.kind());
    EXPECT_EQ("speech_started", c.action());
    EXPECT_EQ("item_1", c.id());

    Envelope bare = Envelope::control("clear");
    EXPECT_FALSE(bare.has("id"));

    Envelope e = Envelope::error("boom");
    EXPECT_EQ("boom", e.get("content"));

    Envelope u = Envelope::userMessage("u1", "Hello");
    EXPECT_EQ("u1", u.id());
    EXPECT_EQ("Hello", u.get("text"));
}

TEST(Envelope, DeltaAndTranscriptionRequireId) {
    EXPECT_THROW(Envelope::textDelta("", "Hi"), std::invalid_argument);
    EXPECT_THROW(Envelope::transcription("", "Hi"), std::invalid_argument);
    EXPECT_NO_THROW(Envelope::textDelta("r1", ""));
}

TEST(Envelope, AudioCarriesOnlyPcm) {
    const uint8_t bytes[] = { 0x01, 0x00, 0xff, 0x7f };
    Envelope a = Envelope::audio(bytes, sizeof(bytes));
    EXPECT_TRUE(a.isAudio());
    EXPECT_EQ(2u, a.sampleCount());
    EXPECT_THROW(a.set("id", "x"), std::logic_error);
    EXPECT_THROW(a.setFlag("final", true), std::logic_error);
    EXPECT_EQ("", envelopeToJson(a));

    std::vector<uint8_t> back = a.releasePcm();
    EXPECT_EQ(4u, back.size());
    EXPECT_TRUE(a.pcm().empty());
}

TEST(Envelope, MissingFieldsReadAsEmpty) {
    Envelope env(KIND_ASSISTANT_MESSAGE);
    EXPECT_EQ("", env.get("text"));
    EXPECT_FALSE(env.flag("final"));
}

TEST(Envelope, JsonCarriesTypeFieldsAndFlags) {
    Envelope env = Envelope::assistantMessage("item_9", "Hi there!");
    env.setFlag("final", true).setFlag("is_audio_transcript", false);

    jsonPtr root = jsonParse(envelopeToJson(env));
    ASSERT_TRUE(root);
    EXPECT_EQ("assistant_message", jsonGetString(root.get(), "type"));
    EXPECT_EQ("item_9", jsonGetString(root.get(), "id"));
    EXPECT_EQ("Hi there!", jsonGetString(root.get(), "text"));
    EXPECT_TRUE(cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(root.get(), "final")));
    EXPECT_TRUE(cJSON_IsFalse(cJSON_GetObjectItemCaseSensitive(root.get(), "is_audio_transcript")));
}

TEST(Envelope, TypeFieldCannotBeOverridden) {
    Envelope env = Envelope::error("x");
    env.set("type", "control");
    jsonPtr root = jsonParse(envelopeToJson(env));
    ASSERT_TRUE(root);
    EXPECT_EQ("error", jsonGetString(root.get(), "type"));
}

TEST(Envelope, JsonEscapesText) {
    Envelope env = Envelope::userMessage("u1", "say \"hi\"\nplease");
    jsonPtr root = jsonParse(envelopeToJson(env));
    ASSERT_TRUE(root);
    EXPECT_EQ("say \"hi\"\nplease", jsonGetString(root.get(), "text"));
}

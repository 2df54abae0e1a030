#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "message_router.h"

TEST(MessageRouter, DispatchesToRegisteredHandler) {
    MessageRouter router("test");
    std::vector<std::string> seen;
    router.registerHandler(KIND_ERROR, [&](const Envelope &env) {
        seen.push_back(env.get("content"));
    });

    EXPECT_TRUE(router.dispatch(Envelope::error("first")));
    EXPECT_FALSE(router.dispatch(Envelope::control("clear")));
    ASSERT_EQ(1u, seen.size());
    EXPECT_EQ("first", seen[0]);
}

TEST(MessageRouter, LastRegistrationWins) {
    MessageRouter router("test");
    int a = 0, b = 0;
    router.registerHandler(KIND_CONTROL, [&](const Envelope &) { ++a; });
    router.registerHandler(KIND_CONTROL, [&](const Envelope &) { ++b; });
    router.dispatch(Envelope::control("clear"));
    EXPECT_EQ(0, a);
    EXPECT_EQ(1, b);
}

TEST(MessageRouter, UnregisterStopsDelivery) {
    MessageRouter router("test");
    int calls = 0;
    router.registerHandler(KIND_CONTROL, [&](const Envelope &) { ++calls; });
    router.registerHandler(KIND_ERROR, [&](const Envelope &) { ++calls; });

    router.unregisterHandler(KIND_CONTROL);
    EXPECT_FALSE(router.hasHandler(KIND_CONTROL));
    EXPECT_TRUE(router.hasHandler(KIND_ERROR));

    router.unregisterAll();
    EXPECT_FALSE(router.dispatch(Envelope::error("x")));
    EXPECT_EQ(0, calls);
}

TEST(MessageRouter, HandlerMayReenterRouter) {
    MessageRouter router("test");
    int errors = 0;
    router.registerHandler(KIND_ERROR, [&](const Envelope &) { ++errors; });
    router.registerHandler(KIND_CONTROL, [&](const Envelope &) {
        router.unregisterHandler(KIND_CONTROL);
        router.dispatch(Envelope::error("from handler"));
    });

    EXPECT_TRUE(router.dispatch(Envelope::control("x")));
    EXPECT_EQ(1, errors);
    EXPECT_FALSE(router.hasHandler(KIND_CONTROL));
}

TEST(MessageRouter, DeltasCoalesceByIdInArrivalOrder) {
    MessageRouter router("provider");
    router.dispatch(Envelope::textDelta("r1", "Hi"));
    router.dispatch(Envelope::textDelta("r1", " there"));
    router.dispatch(Envelope::textDelta("r1", "!"));

    EXPECT_TRUE(router.hasStream("r1"));
    EXPECT_EQ("Hi there!", router.coalescedText("r1"));
}

TEST(MessageRouter, DeltaStreamsAreIndependent) {
    MessageRouter router("provider");
    router.dispatch(Envelope::textDelta("a", "one "));
    router.dispatch(Envelope::textDelta("b", "two "));
    router.dispatch(Envelope::textDelta("a", "three"));

    EXPECT_EQ("one three", router.coalescedText("a"));
    EXPECT_EQ("two ", router.coalescedText("b"));
    EXPECT_EQ(2u, router.streamCount());
}

TEST(MessageRouter, DeltasCoalesceWithoutAHandler) {
    MessageRouter router("provider");
    EXPECT_FALSE(router.dispatch(Envelope::textDelta("r1", "Hi")));
    EXPECT_EQ("Hi", router.coalescedText("r1"));
}

TEST(MessageRouter, HandlerSeesTextIncludingCurrentDelta) {
    MessageRouter router("provider");
    std::string observed;
    router.registerHandler(KIND_TEXT_DELTA, [&](const Envelope &env) {
        observed = router.coalescedText(env.id());
    });
    router.dispatch(Envelope::textDelta("r1", "Hi"));
    router.dispatch(Envelope::textDelta("r1", " you"));
    EXPECT_EQ("Hi you", observed);
}

TEST(MessageRouter, ForgetAndClearDropStreams) {
    MessageRouter router("provider");
    router.dispatch(Envelope::textDelta("a", "x"));
    router.dispatch(Envelope::textDelta("b", "y"));

    router.forget("a");
    EXPECT_FALSE(router.hasStream("a"));
    EXPECT_EQ("", router.coalescedText("a"));
    EXPECT_TRUE(router.hasStream("b"));

    router.clear();
    EXPECT_EQ(0u, router.streamCount());
}

TEST(MessageRouter, OldestStreamEvictedPastLimit) {
    MessageRouter router("provider", 2);
    router.dispatch(Envelope::textDelta("a", "1"));
    router.dispatch(Envelope::textDelta("b", "2"));
    router.dispatch(Envelope::textDelta("c", "3"));

    EXPECT_FALSE(router.hasStream("a"));
    EXPECT_TRUE(router.hasStream("b"));
    EXPECT_TRUE(router.hasStream("c"));
}

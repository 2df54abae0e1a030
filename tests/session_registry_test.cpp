#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fakes.h"
#include "session_registry.h"
#include "tool_registry.h"

namespace {

    /* Each session gets its own scripted provider. */
    ProviderTransportFactory freshFakes() {
        return [](const RelayConfig &, const std::string &) -> std::shared_ptr<ProviderTransport> {
            return std::make_shared<FakeProviderTransport>();
        };
    }

    bool waitForSize(SessionRegistry &registry, size_t n, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (registry.size() == n) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return registry.size() == n;
    }

} /* anonymous namespace */

class SessionRegistryTest : public ::testing::Test {
protected:
    SessionRegistryTest()
        : cfg(testConfig()),
          tools(ToolRegistry::withBuiltins()),
          registry(cfg, freshFakes(), tools)
    {
    }

    RelayConfig      cfg;
    ToolRegistry     tools;
    SessionRegistry  registry;
};

TEST_F(SessionRegistryTest, OneSessionPerConnection) {
    auto frontend = std::make_shared<FakeFrontendTransport>();

    auto session = registry.open(frontend);
    ASSERT_TRUE(session);
    EXPECT_TRUE(registry.hasSessionFor(frontend.get()));
    EXPECT_FALSE(registry.open(frontend));
    EXPECT_EQ(1u, registry.size());

    auto other = std::make_shared<FakeFrontendTransport>();
    auto second = registry.open(other);
    ASSERT_TRUE(second);
    EXPECT_NE(session->id(), second->id());
    EXPECT_EQ(2u, registry.size());
}

TEST_F(SessionRegistryTest, RejectsNullAndClosedSockets) {
    EXPECT_FALSE(registry.open(nullptr));

    auto frontend = std::make_shared<FakeFrontendTransport>();
    frontend->close(1000, "", std::chrono::milliseconds(0));
    EXPECT_FALSE(registry.open(frontend));
}

TEST_F(SessionRegistryTest, FinishedSessionsAreReaped) {
    auto frontend = std::make_shared<FakeFrontendTransport>();
    auto session = registry.open(frontend);
    ASSERT_TRUE(session);
    ASSERT_TRUE(frontend->waitReading(std::chrono::seconds(2)));

    frontend->peerClose("tab closed");
    ASSERT_TRUE(waitForSize(registry, 0, std::chrono::seconds(2)));
    EXPECT_EQ(SESSION_CLOSED, session->state());
    EXPECT_FALSE(registry.hasSessionFor(frontend.get()));
}

TEST_F(SessionRegistryTest, ShutdownClosesEverySession) {
    auto a = std::make_shared<FakeFrontendTransport>();
    auto b = std::make_shared<FakeFrontendTransport>();
    auto sa = registry.open(a);
    auto sb = registry.open(b);
    ASSERT_TRUE(sa);
    ASSERT_TRUE(sb);

    registry.shutdown("test over");
    EXPECT_EQ(SESSION_CLOSED, sa->state());
    EXPECT_EQ(SESSION_CLOSED, sb->state());
    EXPECT_EQ(1, a->closeCalls());
    EXPECT_EQ(1, b->closeCalls());
    EXPECT_EQ(0u, registry.size());

    EXPECT_FALSE(registry.open(std::make_shared<FakeFrontendTransport>()));
}

TEST(SessionRegistryReaping, WorkerPostsItsOwnReap) {
    RelayConfig cfg = testConfig();
    ToolRegistry tools = ToolRegistry::withBuiltins();

    std::mutex m;
    std::condition_variable cv;
    std::vector<std::function<void()>> posted;
    SessionRegistry registry(cfg, freshFakes(), tools, [&](std::function<void()> task) {
        std::lock_guard<std::mutex> lk(m);
        posted.push_back(std::move(task));
        cv.notify_all();
    });

    auto frontend = std::make_shared<FakeFrontendTransport>();
    ASSERT_TRUE(registry.open(frontend));
    ASSERT_TRUE(frontend->waitReading(std::chrono::seconds(2)));
    frontend->peerClose("tab closed");

    std::function<void()> reap;
    {
        std::unique_lock<std::mutex> lk(m);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&]() { return !posted.empty(); }));
        EXPECT_EQ(1u, posted.size());
        reap = posted.front();
    }

    /* nothing else touches the registry; only the posted task frees the entry */
    EXPECT_EQ(1u, registry.entryCount());
    reap();
    EXPECT_EQ(0u, registry.entryCount());
    EXPECT_FALSE(registry.hasSessionFor(frontend.get()));
}

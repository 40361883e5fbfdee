#include "Module.h"
#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

// Test Module base class functionality
class TestModule : public mc::Module {
public:
    TestModule(const std::string& name) : mc::Module(name) {}
};

class CountingService : public mc::Service {
public:
    CountingService() : mc::Service("mt_service") {}
    ~CountingService() override { stop(); }

    std::atomic<int> loops{0};
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> stopped{false};
    bool failStart{false};

protected:
    Roe<void> onStart() override {
        if (failStart) {
            return Error(1, "refused");
        }
        return {};
    }

    void runLoop() override {
        while (!isStopSet()) {
            ++loops;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void onStopRequested() override { stopRequested = true; }
    void onStop() override { stopped = true; }
};

TEST(ModuleTest, LogReturnsLoggerReference) {
    TestModule module("mt_module");

    EXPECT_NO_THROW({
        module.log().info << "Test message";
        module.log().debug << "Debug message";
        module.log().warning << "Warning message";
    });

    EXPECT_EQ(module.log().getName(), "mt_module");
    EXPECT_EQ(module.getLoggerName(), "mt_module");
}

TEST(ModuleTest, LogIsConst) {
    const TestModule module("mt_const");
    EXPECT_NO_THROW(module.log().info << "Const test message");
    EXPECT_EQ(module.log().getName(), "mt_const");
}

TEST(ModuleTest, RedirectLoggerMovesUnderTarget) {
    TestModule module("mt_redirect");
    module.redirectLogger("mt_target");

    EXPECT_EQ(module.log().getParent(), mc::logging::getLogger("mt_target"));
    EXPECT_EQ(module.log().getFullName(), "mt_target.mt_redirect");
    EXPECT_NO_THROW(module.log().info << "Message via redirect");
}

TEST(ServiceTest, StartAndStopRunsHooks) {
    CountingService service;
    EXPECT_FALSE(service.isRunning());
    EXPECT_TRUE(service.isStopSet());

    ASSERT_TRUE(service.start().isOk());
    EXPECT_TRUE(service.isRunning());
    EXPECT_FALSE(service.isStopSet());

    while (service.loops.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    service.stop();
    EXPECT_FALSE(service.isRunning());
    EXPECT_TRUE(service.stopRequested.load());
    EXPECT_TRUE(service.stopped.load());
}

TEST(ServiceTest, DoubleStartIsRejected) {
    CountingService service;
    ASSERT_TRUE(service.start().isOk());
    EXPECT_TRUE(service.start().isError());
    service.stop();
}

TEST(ServiceTest, FailedOnStartLeavesServiceStopped) {
    CountingService service;
    service.failStart = true;
    auto result = service.start();
    EXPECT_TRUE(result.isError());
    EXPECT_FALSE(service.isRunning());
}

TEST(ServiceTest, StopWithoutStartIsNoop) {
    CountingService service;
    EXPECT_NO_THROW(service.stop());
    EXPECT_FALSE(service.stopped.load());
}

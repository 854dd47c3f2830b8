// EN: Unit tests for SignalHandler
// FR: Tests unitaires pour SignalHandler

#include <gtest/gtest.h>
#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <csignal>

using namespace ConCat;

class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        SignalHandler::getInstance().reset();
    }

    void TearDown() override {
        auto& handler = SignalHandler::getInstance();
        handler.reset();
        handler.restore();
    }
};

TEST_F(SignalHandlerTest, StartsWithoutPendingShutdown) {
    auto& handler = SignalHandler::getInstance();
    EXPECT_FALSE(handler.isShutdownRequested());
    EXPECT_EQ(handler.lastSignal(), 0);
    EXPECT_EQ(handler.signalCount(), 0);
}

TEST_F(SignalHandlerTest, ManualTriggerRecordsSignal) {
    auto& handler = SignalHandler::getInstance();
    handler.triggerShutdown(SIGINT);

    EXPECT_TRUE(handler.isShutdownRequested());
    EXPECT_EQ(handler.lastSignal(), SIGINT);

    EXPECT_EQ(handler.signalCount(), 1);
}

TEST_F(SignalHandlerTest, ResetClearsState) {
    auto& handler = SignalHandler::getInstance();
    handler.triggerShutdown(SIGTERM);
    handler.reset();

    EXPECT_FALSE(handler.isShutdownRequested());
    EXPECT_EQ(handler.lastSignal(), 0);
    EXPECT_EQ(handler.signalCount(), 0);
}

TEST_F(SignalHandlerTest, RaisedSignalIsCaughtAfterInitialize) {
    auto& handler = SignalHandler::getInstance();
    handler.initialize();
    ASSERT_TRUE(handler.isInitialized());

    std::raise(SIGTERM);

    EXPECT_TRUE(handler.isShutdownRequested());
    EXPECT_EQ(handler.lastSignal(), SIGTERM);
    EXPECT_EQ(handler.signalCount(), 1);
}

TEST_F(SignalHandlerTest, InitializeIsIdempotentAndRestorable) {
    auto& handler = SignalHandler::getInstance();
    handler.initialize();
    handler.initialize();
    EXPECT_TRUE(handler.isInitialized());

    handler.restore();
    EXPECT_FALSE(handler.isInitialized());
}

TEST_F(SignalHandlerTest, CountsRepeatedSignals) {
    auto& handler = SignalHandler::getInstance();
    handler.triggerShutdown(SIGINT);
    handler.triggerShutdown(SIGINT);
    handler.triggerShutdown(SIGINT);

    EXPECT_EQ(handler.signalCount(), 3);
    EXPECT_EQ(handler.lastSignal(), SIGINT);
}

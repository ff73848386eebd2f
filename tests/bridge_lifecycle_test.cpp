#include "fake_models.hpp"

#include <network/bridge_config.hpp>
#include <network/bridge_lifecycle.hpp>
#include <network/bridge_server.hpp>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace Testing {

class BridgeLifecycleTest : public ::testing::Test
{
  public:
    std::ostringstream out;
    std::ostringstream err;
    TBridgeConfig config{EBridgeVerbosity::Info, "127.0.0.1", 0, "/chat", "copilot",
                         std::chrono::milliseconds(10), out, err};
};

TEST_F(BridgeLifecycleTest, UnknownCommand)
{
    const CLifecycleContext context;
    EXPECT_FALSE(context.ExecuteCommand("llm-bridge.unknown"));
}

TEST_F(BridgeLifecycleTest, CommandsAreExecuted)
{
    CLifecycleContext context;
    int called = 0;
    context.RegisterCommand("count", [&called]() {
        ++called;
    });
    EXPECT_TRUE(context.ExecuteCommand("count"));
    EXPECT_TRUE(context.ExecuteCommand("count"));
    EXPECT_EQ(called, 2);
}

TEST_F(BridgeLifecycleTest, DisposedInReverseOrderOnce)
{
    std::vector<int> order;
    {
        CLifecycleContext context;
        context.PushDisposable([&order]() {
            order.push_back(1);
        });
        context.PushDisposable([&order]() {
            order.push_back(2);
        });
        context.PushDisposable([&order]() {
            order.push_back(3);
        });
        context.DisposeAll();
        context.DisposeAll();
    }
    EXPECT_EQ(order, (std::vector<int>{3, 2, 1}));
}

TEST_F(BridgeLifecycleTest, DestructorDisposes)
{
    bool disposed = false;
    {
        CLifecycleContext context;
        context.PushDisposable([&disposed]() {
            disposed = true;
        });
    }
    EXPECT_TRUE(disposed);
}

TEST_F(BridgeLifecycleTest, ActivationDoesNotStartServer)
{
    CBridgeActivation activation(config, std::make_shared<CFakeModelHost>());
    CLifecycleContext context;
    activation.Activate(context);

    EXPECT_FALSE(activation.State().IsListening());
    EXPECT_FALSE(activation.LastStartResult().has_value());
    EXPECT_NE(out.str().find(CBridgeActivation::kStartCommand), std::string::npos);
}

TEST_F(BridgeLifecycleTest, StartStopByCommands)
{
    CBridgeActivation activation(config, std::make_shared<CFakeModelHost>());
    CLifecycleContext context;
    activation.Activate(context);

    EXPECT_TRUE(context.ExecuteCommand(CBridgeActivation::kStartCommand));
    EXPECT_EQ(activation.LastStartResult(), EStartResult::Started);
    EXPECT_TRUE(activation.State().IsListening());
    EXPECT_GT(activation.State().BoundPort(), 0);

    EXPECT_TRUE(context.ExecuteCommand(CBridgeActivation::kStartCommand));
    EXPECT_EQ(activation.LastStartResult(), EStartResult::AlreadyRunning);

    EXPECT_TRUE(context.ExecuteCommand(CBridgeActivation::kStopCommand));
    EXPECT_FALSE(activation.State().IsListening());
    EXPECT_EQ(activation.State().BoundPort(), -1);
}

TEST_F(BridgeLifecycleTest, DisposeStopsServer)
{
    CBridgeActivation activation(config, std::make_shared<CFakeModelHost>());
    CLifecycleContext context;
    activation.Activate(context);
    ASSERT_TRUE(context.ExecuteCommand(CBridgeActivation::kStartCommand));
    ASSERT_TRUE(activation.State().IsListening());

    context.DisposeAll();
    EXPECT_FALSE(activation.State().IsListening());
    EXPECT_EQ(activation.State().Status(), EBridgeServerStatus::Stopped);
    EXPECT_FALSE(context.ExecuteCommand(CBridgeActivation::kStartCommand));
}

} // namespace Testing

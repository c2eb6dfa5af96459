#include <gtest/gtest.h>

#include "cellguard/utils/channel.hpp"

#include <stdexcept>
#include <thread>

namespace cellguard {
namespace utils {

using namespace testing;

/*******************************************************************************
 * Tests
 ******************************************************************************/

TEST(ChannelTest, RejectsZeroCapacity)
{
    EXPECT_THROW(Channel<int>(0), std::invalid_argument);
}

TEST(ChannelTest, TrySendFailsWhenFull)
{
    Channel<int> channel(2);

    EXPECT_TRUE(channel.TrySend(1));
    EXPECT_TRUE(channel.TrySend(2));
    EXPECT_FALSE(channel.TrySend(3));
    EXPECT_EQ(channel.Size(), 2u);

    EXPECT_EQ(channel.TryReceive(), 1);
    EXPECT_TRUE(channel.TrySend(3));
}

TEST(ChannelTest, ReceiversDrainAfterClose)
{
    Channel<int> channel(4);

    channel.TrySend(7);
    channel.TrySend(8);

    EXPECT_TRUE(channel.Close());
    EXPECT_FALSE(channel.Close());
    EXPECT_FALSE(channel.TrySend(9));

    EXPECT_EQ(channel.Receive(), 7);
    EXPECT_EQ(channel.Receive(), 8);
    EXPECT_EQ(channel.Receive(), std::nullopt);
}

TEST(ChannelTest, CloseWakesBlockedReceiver)
{
    Channel<int> channel(1);
    std::optional<int> received = 42;

    std::thread receiver([&] { received = channel.Receive(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.Close();
    receiver.join();

    EXPECT_EQ(received, std::nullopt);
}

TEST(ChannelTest, ReceiveForTimesOut)
{
    Channel<int> channel(1);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(channel.ReceiveFor(std::chrono::milliseconds(30)), std::nullopt);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
    EXPECT_FALSE(channel.IsClosed());
}

TEST(ChannelTest, BlockingSendResumesWhenSpaceFrees)
{
    Channel<int> channel(1);
    channel.TrySend(1);

    std::thread sender([&] { EXPECT_TRUE(channel.Send(2)); });

    EXPECT_EQ(channel.Receive(), 1);
    EXPECT_EQ(channel.Receive(), 2);
    sender.join();
}

} // namespace utils
} // namespace cellguard

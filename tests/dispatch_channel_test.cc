#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "dispatch_channel.h"

TEST(DispatchChannelTest, DeliversInSendOrder)
{
	dispatch_channel<int> channel;

	for (int i = 0; i < 5; i++)
		channel.send(int {i});

	EXPECT_EQ(channel.size(), 5u);

	for (int i = 0; i < 5; i++) {
		int item = -1;

		ASSERT_TRUE(channel.receive(&item));
		EXPECT_EQ(item, i);
	}

	EXPECT_EQ(channel.size(), 0u);
}

TEST(DispatchChannelTest, SendOnClosedChannelThrows)
{
	dispatch_channel<int> channel;

	channel.close();
	EXPECT_TRUE(channel.is_closed());
	EXPECT_THROW(channel.send(1), std::logic_error);
}

TEST(DispatchChannelTest, ReceiveDrainsQueuedItemsAfterClose)
{
	dispatch_channel<int> channel;
	int item = 0;

	channel.send(7);
	channel.close();

	ASSERT_TRUE(channel.receive(&item));
	EXPECT_EQ(item, 7);
	EXPECT_FALSE(channel.receive(&item));
}

TEST(DispatchChannelTest, ReceiveBlocksUntilAnItemArrives)
{
	dispatch_channel<int> channel;
	std::atomic<bool> received {false};
	int item = 0;

	std::thread consumer([&] {
		if (channel.receive(&item))
			received = true;
	});

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	EXPECT_FALSE(received);
	channel.send(42);
	consumer.join();

	EXPECT_TRUE(received);
	EXPECT_EQ(item, 42);
}

TEST(DispatchChannelTest, EveryItemGoesToExactlyOneConsumer)
{
	const int num_items = 1000;
	const int num_consumers = 4;
	dispatch_channel<int> channel;
	std::vector<std::atomic<int>> deliveries(num_items);
	std::vector<std::thread> consumers;

	for (auto& d : deliveries)
		d = 0;

	for (int i = 0; i < num_consumers; i++)
		consumers.emplace_back([&] {
			int item;

			while (channel.receive(&item))
				deliveries[item]++;
		});

	for (int i = 0; i < num_items; i++)
		channel.send(int {i});

	channel.close();

	for (auto& c : consumers)
		c.join();

	for (int i = 0; i < num_items; i++)
		EXPECT_EQ(deliveries[i].load(), 1) << "item " << i;
}

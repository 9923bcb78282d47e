/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"
#include "curlagent/aux_/message_queue.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace curlagent;
using namespace curlagent::aux;

CURLAGENT_TEST(message_queue_fifo)
{
	auto c = make_channel<int>();
	for (int i = 0; i < 10; ++i) TEST_CHECK(c.first.send(i));

	for (int i = 0; i < 10; ++i)
	{
		std::optional<int> m = c.second.try_recv();
		TEST_CHECK(m);
		if (m) TEST_EQUAL(*m, i);
	}
	TEST_CHECK(!c.second.try_recv());
}

CURLAGENT_TEST(message_queue_disconnect)
{
	auto c = make_channel<int>();
	TEST_CHECK(!c.second.disconnected());

	message_sender<int> copy = c.first;
	c.first.send(1);
	{
		message_sender<int> gone = std::move(c.first);
	}
	TEST_CHECK(!c.second.disconnected());

	copy.send(2);
	{
		message_sender<int> gone = std::move(copy);
	}
	TEST_CHECK(c.second.disconnected());

	// queued messages are still delivered after the senders are gone
	std::optional<int> m = c.second.recv();
	TEST_CHECK(m && *m == 1);
	m = c.second.recv();
	TEST_CHECK(m && *m == 2);
	TEST_CHECK(!c.second.recv());
}

CURLAGENT_TEST(message_queue_receiver_gone)
{
	auto c = make_channel<std::unique_ptr<int>>();
	{
		message_receiver<std::unique_ptr<int>> r = std::move(c.second);
	}
	TEST_CHECK(!c.first.send(std::make_unique<int>(1)));
}

CURLAGENT_TEST(message_queue_blocking_recv)
{
	auto c = make_channel<int>();
	std::atomic<int> received{-1};

	std::thread t([&]
	{
		std::optional<int> m = c.second.recv();
		received = m ? *m : -2;
	});

	std::this_thread::sleep_for(milliseconds(50));
	TEST_EQUAL(received.load(), -1);
	c.first.send(7);
	t.join();
	TEST_EQUAL(received.load(), 7);
}

CURLAGENT_TEST(message_queue_wake_on_disconnect)
{
	auto c = make_channel<int>();
	std::atomic<bool> done{false};
	std::atomic<bool> got_message{true};

	std::thread t([&]
	{
		got_message = bool(c.second.recv());
		done = true;
	});

	{
		message_sender<int> gone = std::move(c.first);
	}
	t.join();
	TEST_CHECK(done);
	TEST_CHECK(!got_message);
}

CURLAGENT_TEST(message_queue_many_senders)
{
	int const num_threads = 8;
	int const per_thread = 1000;

	auto c = make_channel<int>();
	std::vector<std::thread> threads;
	for (int i = 0; i < num_threads; ++i)
	{
		threads.emplace_back([s = c.first, i]() mutable
		{
			for (int k = 0; k < per_thread; ++k)
				s.send(i * per_thread + k);
		});
	}
	{
		message_sender<int> gone = std::move(c.first);
	}

	// per sender, messages arrive in the order they were sent
	std::vector<int> last(num_threads, -1);
	int count = 0;
	while (std::optional<int> m = c.second.recv())
	{
		int const sender = *m / per_thread;
		TEST_CHECK(*m > last[std::size_t(sender)]);
		last[std::size_t(sender)] = *m;
		++count;
	}
	for (auto& t : threads) t.join();
	TEST_EQUAL(count, num_threads * per_thread);
}

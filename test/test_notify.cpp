/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "curlagent/aux_/notify.hpp"

#include <thread>

#include <poll.h>

using namespace curlagent;
using namespace curlagent::aux;

#if CURLAGENT_USE_NOTIFY_PIPE

namespace {

bool readable(notify_receiver const& r, int const timeout_ms)
{
	pollfd p{};
	p.fd = r.native_handle();
	p.events = POLLIN;
	return ::poll(&p, 1, timeout_ms) == 1 && (p.revents & POLLIN);
}

}

CURLAGENT_TEST(notify_wakes_receiver)
{
	error_code ec;
	auto n = create_notify(ec);
	TEST_CHECK(!ec);
	TEST_CHECK(n.second.is_supported());
	TEST_CHECK(n.second.native_handle() >= 0);

	TEST_CHECK(!readable(n.second, 0));
	TEST_CHECK(!n.second.drain());

	n.first.notify();
	TEST_CHECK(readable(n.second, 1000));
	TEST_CHECK(n.second.drain());
	TEST_CHECK(!readable(n.second, 0));
}

CURLAGENT_TEST(notify_coalesces)
{
	error_code ec;
	auto n = create_notify(ec);
	TEST_CHECK(!ec);

	notify_sender const copy = n.first;
	for (int i = 0; i < 100; ++i)
	{
		n.first.notify();
		copy.notify();
	}
	TEST_CHECK(readable(n.second, 0));
	TEST_CHECK(n.second.drain());
	TEST_CHECK(!readable(n.second, 0));
	TEST_CHECK(!n.second.drain());
}

CURLAGENT_TEST(notify_never_blocks)
{
	error_code ec;
	auto n = create_notify(ec);
	TEST_CHECK(!ec);

	// far more than fits in a pipe buffer
	for (int i = 0; i < 200000; ++i) n.first.notify();
	TEST_CHECK(n.second.drain());
}

CURLAGENT_TEST(notify_after_receiver_gone)
{
	error_code ec;
	auto n = create_notify(ec);
	TEST_CHECK(!ec);
	{
		notify_receiver r = std::move(n.second);
	}
	TEST_NOTHROW(n.first.notify());
}

CURLAGENT_TEST(notify_from_other_thread)
{
	error_code ec;
	auto n = create_notify(ec);
	TEST_CHECK(!ec);

	std::thread t([s = n.first] { s.notify(); });
	TEST_CHECK(readable(n.second, 5000));
	t.join();
	TEST_CHECK(n.second.drain());
}

#else

CURLAGENT_TEST(notify_unsupported)
{
	error_code ec;
	auto n = create_notify(ec);
	TEST_CHECK(!ec);
	TEST_CHECK(!n.second.is_supported());
	TEST_EQUAL(n.second.native_handle(), -1);
	TEST_NOTHROW(n.first.notify());
	TEST_CHECK(!n.second.drain());
}

#endif

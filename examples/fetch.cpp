/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/agent.hpp"
#include "curlagent/transfer.hpp"
#include "curlagent/error_code.hpp"

#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {

struct completion_counter
{
	explicit completion_counter(int n) : m_remaining(n) {}

	void done()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (--m_remaining == 0) m_cond.notify_all();
	}

	void wait()
	{
		std::unique_lock<std::mutex> l(m_mutex);
		m_cond.wait(l, [this] { return m_remaining == 0; });
	}

private:
	std::mutex m_mutex;
	std::condition_variable m_cond;
	int m_remaining;
};

struct fetch_handler : curlagent::transfer_handler
{
	fetch_handler(std::string url, completion_counter& c)
		: m_url(std::move(url)), m_counter(c) {}

	std::size_t on_header(char const* data, std::size_t const len) override
	{
		// the status line of the last response, after redirects
		if (len > 5 && std::strncmp(data, "HTTP/", 5) == 0)
		{
			m_status.assign(data, len);
			while (!m_status.empty() && (m_status.back() == '\r' || m_status.back() == '\n'))
				m_status.pop_back();
		}
		return len;
	}

	std::size_t on_write(char const*, std::size_t const len) override
	{
		m_bytes += len;
		return len;
	}

	void on_complete() override
	{
		std::printf("%s: %s (%llu bytes)\n", m_url.c_str()
			, m_status.empty() ? "OK" : m_status.c_str()
			, static_cast<unsigned long long>(m_bytes));
		m_counter.done();
	}

	void on_fail(curlagent::error_code const& ec) override
	{
		std::printf("%s: FAILED: %s\n", m_url.c_str(), ec.message().c_str());
		m_counter.done();
	}

private:
	std::string m_url;
	std::string m_status;
	std::uint64_t m_bytes = 0;
	completion_counter& m_counter;
};

}

int main(int argc, char* argv[]) try
{
	if (argc < 2) {
		std::cerr << "usage: ./fetch url [url...]\n"
			"fetches every url concurrently and prints the status and the "
			"number of bytes received\n";
		return 1;
	}

	curlagent::agent_params p;
	p.min_log_level = curlagent::log_level::warning;
	curlagent::agent_handle h = curlagent::create_agent(std::move(p));

	completion_counter counter(argc - 1);
	for (int i = 1; i < argc; ++i)
	{
		auto t = std::make_unique<curlagent::transfer>(
			std::make_shared<fetch_handler>(argv[i], counter));
		t->set_url(argv[i]);
		t->setopt(CURLOPT_FOLLOWLOCATION, 1L);
		h.begin_execute(std::move(t));
	}

	counter.wait();

	// let the worker finish before the process tears down libcurl
	h.close();
	while (!h.is_terminated())
		std::this_thread::sleep_for(curlagent::milliseconds(10));
	return 0;
}
catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}

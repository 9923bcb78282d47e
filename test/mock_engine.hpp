/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_MOCK_ENGINE_HPP
#define CURLAGENT_MOCK_ENGINE_HPP

#include "curlagent/transfer.hpp"
#include "curlagent/transfer_engine.hpp"
#include "curlagent/error_code.hpp"
#include "curlagent/aux_/notify.hpp"

#include <atomic>
#include <cerrno>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <tuple>
#include <utility>
#include <vector>

#include <poll.h>

// the test's view of a mock_engine. The engine itself is owned by the agent
// and lives on its worker thread, this part is shared with the test
struct mock_engine_state
{
	mock_engine_state()
	{
		curlagent::error_code ec;
		std::tie(wake_tx, wake_rx) = curlagent::aux::create_notify(ec);
	}

	// makes the transfer with this token finish with the given result (an
	// empty error_code means success) on the next progress step
	void finish(curlagent::token_t const t, curlagent::error_code const& ec = {})
	{
		{
			std::lock_guard<std::mutex> l(mutex);
			outcomes[t] = ec;
		}
		wake_tx.notify();
	}

	// makes the next progress step fail with ec, which is fatal to the agent
	void fail_progress(curlagent::error_code const& ec)
	{
		{
			std::lock_guard<std::mutex> l(mutex);
			progress_error = ec;
		}
		wake_tx.notify();
	}

	template <typename Fun>
	auto locked(Fun f)
	{
		std::lock_guard<std::mutex> l(mutex);
		return f();
	}

	mutable std::mutex mutex;

	// scripted results, consumed by drain_events()
	std::map<curlagent::token_t, curlagent::error_code> outcomes;

	// when set, every registered transfer succeeds on the next progress step
	bool auto_complete = false;

	// the tokens bound to a registered transfer right now
	std::set<curlagent::token_t> active;

	// the number of times a token was bound while already active
	int token_violations = 0;

	// the tokens passed to resume_write()
	std::vector<curlagent::token_t> resumed;

	int registered = 0;
	int removed = 0;
	bool shut_down = false;

	curlagent::error_code progress_error;
	curlagent::error_code add_error;

	// the number of times the worker called progress() and wait()
	std::atomic<int> progress_calls{0};
	std::atomic<int> wait_calls{0};

	// held by a test to stop the worker inside progress()
	std::mutex gate;
	std::atomic<int> progress_waiters{0};

	// wakes the engine's wait() when the test scripts something
	curlagent::aux::notify_sender wake_tx;
	curlagent::aux::notify_receiver wake_rx;
};

// a transfer_engine that doesn't do any I/O. The test decides when, and how,
// every transfer finishes
struct mock_engine final : curlagent::transfer_engine
{
	explicit mock_engine(std::shared_ptr<mock_engine_state> s)
		: m_state(std::move(s)) {}

	curlagent::engine_handle add(std::unique_ptr<curlagent::transfer>& t
		, curlagent::error_code& ec) override
	{
		std::lock_guard<std::mutex> l(m_state->mutex);
		if (m_state->add_error)
		{
			ec = m_state->add_error;
			return nullptr;
		}
		curlagent::engine_handle const h = t.get();
		m_transfers[h] = std::make_pair(curlagent::invalid_token, std::move(t));
		++m_state->registered;
		return h;
	}

	std::unique_ptr<curlagent::transfer> remove(curlagent::engine_handle const h
		, curlagent::error_code& ec) override
	{
		std::lock_guard<std::mutex> l(m_state->mutex);
		auto const it = m_transfers.find(h);
		if (it == m_transfers.end())
		{
			ec = curlagent::errors::unknown_token;
			return {};
		}
		m_state->active.erase(it->second.first);
		std::unique_ptr<curlagent::transfer> ret = std::move(it->second.second);
		m_transfers.erase(it);
		++m_state->removed;
		return ret;
	}

	void bind_token(curlagent::engine_handle const h, curlagent::token_t const t
		, curlagent::error_code& ec) override
	{
		std::lock_guard<std::mutex> l(m_state->mutex);
		auto const it = m_transfers.find(h);
		if (it == m_transfers.end())
		{
			ec = curlagent::errors::unknown_token;
			return;
		}
		if (!m_state->active.insert(t).second) ++m_state->token_violations;
		it->second.first = t;
	}

	curlagent::token_t token_of(curlagent::engine_handle const h
		, curlagent::error_code& ec) const override
	{
		std::lock_guard<std::mutex> l(m_state->mutex);
		auto const it = m_transfers.find(h);
		if (it == m_transfers.end())
		{
			ec = curlagent::errors::unknown_token;
			return curlagent::invalid_token;
		}
		return it->second.first;
	}

	void resume_write(curlagent::engine_handle const h, curlagent::error_code& ec) override
	{
		curlagent::token_t const t = token_of(h, ec);
		if (ec) return;
		std::lock_guard<std::mutex> l(m_state->mutex);
		m_state->resumed.push_back(t);
	}

	void progress(curlagent::error_code& ec) override
	{
		++m_state->progress_calls;
		++m_state->progress_waiters;
		{
			std::lock_guard<std::mutex> g(m_state->gate);
		}
		--m_state->progress_waiters;

		std::lock_guard<std::mutex> l(m_state->mutex);
		if (m_state->progress_error) ec = m_state->progress_error;
	}

	void drain_events(std::function<void(curlagent::token_t
		, curlagent::error_code const&)> const& f) override
	{
		std::vector<std::pair<curlagent::token_t, curlagent::error_code>> events;
		{
			std::lock_guard<std::mutex> l(m_state->mutex);
			for (auto const& t : m_transfers)
			{
				curlagent::token_t const token = t.second.first;
				auto const it = m_state->outcomes.find(token);
				if (it != m_state->outcomes.end())
				{
					events.emplace_back(token, it->second);
					m_state->outcomes.erase(it);
				}
				else if (m_state->auto_complete)
				{
					events.emplace_back(token, curlagent::error_code());
				}
			}
		}
		for (auto const& e : events) f(e.first, e.second);
	}

	std::optional<curlagent::milliseconds> suggested_timeout(curlagent::error_code&) override
	{
		return std::nullopt;
	}

	void wait(std::vector<curlagent::wait_fd>& extra, curlagent::milliseconds const timeout
		, curlagent::error_code& ec) override
	{
		++m_state->wait_calls;
		std::vector<pollfd> fds;
		for (auto const& e : extra)
		{
			pollfd p{};
			p.fd = e.fd;
			p.events = (e.events & curlagent::wait_fd::in) ? POLLIN : 0;
			fds.push_back(p);
		}
		if (m_state->wake_rx.is_supported())
		{
			pollfd p{};
			p.fd = m_state->wake_rx.native_handle();
			p.events = POLLIN;
			fds.push_back(p);
		}

		int const ret = ::poll(fds.data(), nfds_t(fds.size()), int(timeout.count()));
		if (ret < 0)
		{
			if (errno == EINTR) return;
			ec.assign(errno, curlagent::system_category());
			return;
		}

		for (std::size_t i = 0; i < extra.size(); ++i)
			extra[i].revents = (fds[i].revents & POLLIN) ? curlagent::wait_fd::in : 0;
		m_state->wake_rx.drain();
	}

	void shutdown(curlagent::error_code&) override
	{
		std::map<curlagent::engine_handle
			, std::pair<curlagent::token_t, std::unique_ptr<curlagent::transfer>>> transfers;
		{
			std::lock_guard<std::mutex> l(m_state->mutex);
			transfers.swap(m_transfers);
			m_state->active.clear();
		}
		// the handlers are destroyed without holding the lock
		transfers.clear();

		std::lock_guard<std::mutex> l(m_state->mutex);
		m_state->shut_down = true;
	}

private:
	std::shared_ptr<mock_engine_state> m_state;
	std::map<curlagent::engine_handle
		, std::pair<curlagent::token_t, std::unique_ptr<curlagent::transfer>>> m_transfers;
};

#endif

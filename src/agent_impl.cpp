/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/aux_/agent_impl.hpp"
#include "curlagent/aux_/agent_shared_state.hpp"
#include "curlagent/transfer.hpp"
#include "curlagent/assert.hpp"

#include <exception>
#include <optional>

namespace curlagent::aux {

	agent::agent(std::unique_ptr<transfer_engine> engine
		, message_receiver<agent_message> messages
		, notify_receiver wake
		, std::weak_ptr<agent_shared_state> shared
		, agent_logger logger
		, milliseconds const default_timeout)
		: m_messages(std::move(messages))
		, m_wake(std::move(wake))
		, m_engine(std::move(engine))
		, m_shared(std::move(shared))
		, m_logger(std::move(logger))
		, m_default_timeout(default_timeout)
	{
		CURLAGENT_ASSERT(m_engine);
	}

	agent::~agent()
	{
		if (std::shared_ptr<agent_shared_state> s = m_shared.lock())
			s->set_terminated();
	}

	void agent::thread_fun()
	{
		try
		{
			error_code const ec = run();
			if (ec)
			{
				m_logger.log(log_level::error, "agent terminated with error: %s"
					, ec.message().c_str());
			}
		}
		catch (std::exception const& e)
		{
			m_logger.log(log_level::error, "agent terminated with exception: %s", e.what());
		}
	}

	error_code agent::run()
	{
		std::vector<wait_fd> wait_fds;
		if (m_wake.is_supported())
		{
			wait_fd fd;
			fd.fd = m_wake.native_handle();
			fd.events = wait_fd::in;
			wait_fds.push_back(fd);
		}
		else
		{
			m_logger.log(log_level::warning, "polling interruption is not supported on your platform");
		}

		m_logger.log(log_level::debug, "agent ready");

		error_code ec;
		for (;;)
		{
			if (m_close_requested && m_requests.empty()) break;

			poll_messages(ec);
			if (ec) return ec;

			if (m_close_requested && m_requests.empty()) break;

			// the default bounds the wait even if a wake-up is lost
			milliseconds timeout = m_default_timeout;
			std::optional<milliseconds> const suggested = m_engine->suggested_timeout(ec);
			if (ec) return ec;
			if (suggested && *suggested < timeout) timeout = *suggested;

			m_logger.log(log_level::trace, "polling with timeout of %d ms"
				, int(timeout.count()));
			m_engine->wait(wait_fds, timeout, ec);
			if (ec) return ec;

			// we might have woken up early from the notify fd, drain it
			if (m_wake.drain())
				m_logger.log(log_level::trace, "woke up from notify fd");

			dispatch(ec);
			if (ec) return ec;

			if (m_state == agent_state::close_requested)
				m_state = agent_state::draining;
			publish_stats();
		}

		m_logger.log(log_level::debug, "agent shutting down");
		m_engine->shutdown(ec);
		return ec;
	}

	void agent::poll_messages(error_code& ec)
	{
		for (;;)
		{
			// an explicit close with nothing left to do ends the loop without
			// waiting for the handles to go away
			if (m_close_requested && m_requests.empty()) return;

			std::optional<agent_message> m;
			if (m_requests.empty())
			{
				// the last message may have emptied the table. The counters
				// must be current before blocking
				publish_stats();

				// nothing to drive, block until there's something to do
				m = m_messages.recv();
				if (!m)
				{
					m_logger.log(log_level::warning, "agent handle disconnected without close message");
					request_close();
					return;
				}
			}
			else
			{
				m = m_messages.try_recv();
				if (!m) return;
			}

			handle_message(std::move(*m), ec);
			if (ec) return;
		}
	}

	void agent::handle_message(agent_message m, error_code& ec)
	{
		if (auto* b = std::get_if<message::begin_request>(&m))
		{
			std::unique_ptr<transfer> t = std::move(b->request);
			CURLAGENT_ASSERT(t);

			error_code add_error;
			engine_handle const h = m_engine->add(t, add_error);
			if (add_error)
			{
				// the engine did not take the transfer, it's still ours
				m_logger.log(log_level::debug, "failed to register transfer: %s"
					, add_error.message().c_str());
				++m_stats.failed;
				t->handler().on_fail(add_error);
				return;
			}

			token_t const token = m_requests.insert(h);
			h->handler().bind_token(token);
			m_engine->bind_token(h, token, ec);
			if (ec) return;
			++m_stats.submitted;
			m_logger.log(log_level::trace, "registered transfer %zu", token);
		}
		else if (auto* c = std::get_if<message::cancel>(&m))
		{
			std::optional<engine_handle> const h = m_requests.remove(c->token);
			if (!h) return;

			std::unique_ptr<transfer> t = m_engine->remove(*h, ec);
			if (ec) return;
			++m_stats.cancelled;
			m_logger.log(log_level::trace, "cancelled transfer %zu", c->token);
			if (t) t->handler().bind_token(invalid_token);
		}
		else if (auto* u = std::get_if<message::unpause_write>(&m))
		{
			engine_handle const* h = m_requests.get(u->token);
			if (h == nullptr)
			{
				m_logger.log(log_level::warning
					, "received unpause request for unknown request token: %zu", u->token);
				return;
			}
			m_engine->resume_write(*h, ec);
		}
		else
		{
			CURLAGENT_ASSERT(std::holds_alternative<message::close>(m));
			m_logger.log(log_level::debug, "agent close requested");
			request_close();
			publish_stats();
		}
	}

	void agent::request_close()
	{
		m_close_requested = true;
		if (m_state == agent_state::running)
			m_state = agent_state::close_requested;
	}

	void agent::dispatch(error_code& ec)
	{
		m_engine->progress(ec);
		if (ec) return;

		m_events.clear();
		m_engine->drain_events([this](token_t const token, error_code const& result)
		{ m_events.emplace_back(token, result); });

		for (auto const& e : m_events)
		{
			if (!e.second)
			{
				complete_request(e.first, ec);
			}
			else
			{
				m_logger.log(log_level::debug, "curl error: %s", e.second.message().c_str());
				fail_request(e.first, e.second, ec);
			}
			if (ec) return;
		}
	}

	void agent::complete_request(token_t const token, error_code& ec)
	{
		std::optional<engine_handle> const h = m_requests.remove(token);
		if (!h) return;

		std::unique_ptr<transfer> t = m_engine->remove(*h, ec);
		if (ec || !t) return;
		++m_stats.completed;
		t->handler().on_complete();
		t->handler().bind_token(invalid_token);
	}

	void agent::fail_request(token_t const token, error_code const& result, error_code& ec)
	{
		std::optional<engine_handle> const h = m_requests.remove(token);
		if (!h) return;

		std::unique_ptr<transfer> t = m_engine->remove(*h, ec);
		if (ec || !t) return;
		++m_stats.failed;
		t->handler().on_fail(result);
		t->handler().bind_token(invalid_token);
	}

	void agent::publish_stats()
	{
		std::shared_ptr<agent_shared_state> s = m_shared.lock();
		if (!s) return;
		m_stats.active_transfers = m_requests.size();
		m_stats.state = m_state;
		s->publish(m_stats);
	}
}

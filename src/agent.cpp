/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/agent.hpp"
#include "curlagent/assert.hpp"
#include "curlagent/aux_/agent_impl.hpp"
#include "curlagent/aux_/agent_shared_state.hpp"
#include "curlagent/aux_/platform_util.hpp"
#include "curlagent/aux_/throw.hpp"

#include <new>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace curlagent {

	char const* to_string(agent_state const s)
	{
		switch (s)
		{
			case agent_state::running: return "running";
			case agent_state::close_requested: return "close_requested";
			case agent_state::draining: return "draining";
			case agent_state::terminated: return "terminated";
		}
		return "unknown";
	}

	agent_handle::agent_handle(std::shared_ptr<aux::agent_shared_state> s)
		: m_impl(std::move(s))
	{}

	agent_handle::~agent_handle() = default;

	void agent_handle::begin_execute(std::unique_ptr<transfer> t, error_code& ec)
	{
		if (!m_impl)
		{
			ec = errors::internal;
			return;
		}
		if (!t)
		{
			ec = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
			return;
		}

		// lets the handler reach cancel_request() and unpause_write()
		t->handler().bind_owning_handle(*this);
		m_impl->send_message(aux::message::begin_request{std::move(t)}, ec);
	}

	void agent_handle::begin_execute(std::unique_ptr<transfer> t)
	{
		error_code ec;
		begin_execute(std::move(t), ec);
		if (ec) aux::throw_ex<system_error>(ec);
	}

	void agent_handle::cancel_request(token_t const token, error_code& ec)
	{
		if (!m_impl)
		{
			ec = errors::internal;
			return;
		}
		m_impl->send_message(aux::message::cancel{token}, ec);
	}

	void agent_handle::cancel_request(token_t const token)
	{
		error_code ec;
		cancel_request(token, ec);
		if (ec) aux::throw_ex<system_error>(ec);
	}

	void agent_handle::unpause_write(token_t const token, error_code& ec)
	{
		if (!m_impl)
		{
			ec = errors::internal;
			return;
		}
		m_impl->send_message(aux::message::unpause_write{token}, ec);
	}

	void agent_handle::unpause_write(token_t const token)
	{
		error_code ec;
		unpause_write(token, ec);
		if (ec) aux::throw_ex<system_error>(ec);
	}

	void agent_handle::close(error_code& ec)
	{
		if (!m_impl)
		{
			ec = errors::internal;
			return;
		}
		m_impl->send_message(aux::message::close{}, ec);
	}

	void agent_handle::close()
	{
		error_code ec;
		close(ec);
		if (ec) aux::throw_ex<system_error>(ec);
	}

	bool agent_handle::is_terminated() const
	{
		return !m_impl || m_impl->terminated();
	}

	agent_stats agent_handle::stats() const
	{
		if (!m_impl)
		{
			agent_stats ret;
			ret.state = agent_state::terminated;
			return ret;
		}
		return m_impl->stats();
	}

	agent_handle create_agent(agent_params params
		, std::unique_ptr<transfer_engine> engine, error_code& ec)
	{
		aux::agent_logger const logger(params.min_log_level, std::move(params.log_handler));

		if (!engine)
		{
			logger.log(log_level::error, "no transfer engine");
			ec = errors::setup_failure;
			return {};
		}

		std::shared_ptr<aux::agent_shared_state> shared;
		try
		{
			auto channel = aux::make_channel<aux::agent_message>();

			error_code notify_error;
			auto wake = aux::create_notify(notify_error);
			if (notify_error)
			{
				logger.log(log_level::error, "failed to create wake notifier: %s"
					, notify_error.message().c_str());
				ec = errors::setup_failure;
				return {};
			}

			shared = std::make_shared<aux::agent_shared_state>(
				std::move(channel.first), std::move(wake.first), logger);

			auto a = std::make_unique<aux::agent>(std::move(engine)
				, std::move(channel.second), std::move(wake.second)
				, shared, logger, params.default_timeout);

			// the agent owns its own lifetime. It ends once a close was
			// requested and every transfer finished, which may happen while a
			// handle is being destroyed on the worker thread itself
			std::thread t([a = std::move(a), name = std::move(params.thread_name)]() mutable
			{
				aux::set_thread_name(name.c_str());
				a->thread_fun();
				a.reset();
			});
			t.detach();
		}
		catch (std::system_error const& e)
		{
			logger.log(log_level::error, "failed to spawn agent thread: %s", e.what());
			ec = errors::setup_failure;
			return {};
		}
		catch (std::bad_alloc const&)
		{
			logger.log(log_level::error, "out of memory while creating agent");
			ec = errors::setup_failure;
			return {};
		}

		return agent_handle(std::move(shared));
	}

	agent_handle create_agent(agent_params params
		, std::unique_ptr<transfer_engine> engine)
	{
		error_code ec;
		agent_handle ret = create_agent(std::move(params), std::move(engine), ec);
		if (ec) aux::throw_ex<system_error>(ec);
		return ret;
	}

	agent_handle create_agent(agent_params params, error_code& ec)
	{
		std::unique_ptr<transfer_engine> engine;
		try
		{
			engine = make_curl_engine(params.engine);
		}
		catch (system_error const& e)
		{
			aux::agent_logger const logger(params.min_log_level, params.log_handler);
			logger.log(log_level::error, "failed to create curl engine: %s", e.what());
			ec = errors::setup_failure;
			return {};
		}
		return create_agent(std::move(params), std::move(engine), ec);
	}

	agent_handle create_agent(agent_params params)
	{
		error_code ec;
		agent_handle ret = create_agent(std::move(params), ec);
		if (ec) aux::throw_ex<system_error>(ec);
		return ret;
	}
}

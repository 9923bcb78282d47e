/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/aux_/agent_shared_state.hpp"

#include <utility>

namespace curlagent::aux {

	agent_shared_state::agent_shared_state(message_sender<agent_message> tx
		, notify_sender wake, agent_logger log)
		: m_sender(std::move(tx))
		, m_wake(std::move(wake))
		, m_logger(std::move(log))
	{}

	agent_shared_state::~agent_shared_state()
	{
		if (terminated()) return;
		error_code ec;
		send_message(message::close{}, ec);
		if (ec)
		{
			m_logger.log(log_level::debug, "could not send close message to agent: %s"
				, ec.message().c_str());
		}
	}

	void agent_shared_state::send_message(agent_message m, error_code& ec)
	{
		if (terminated())
		{
			m_logger.log(log_level::error, "agent thread terminated prematurely");
			ec = errors::internal;
			return;
		}

		if (!m_sender.send(std::move(m)))
		{
			ec = errors::internal;
			return;
		}
		m_wake.notify();
	}

	void agent_shared_state::set_terminated()
	{
		m_state.store(std::uint8_t(agent_state::terminated), std::memory_order_release);
		m_terminated.store(true, std::memory_order_release);
	}

	void agent_shared_state::publish(agent_stats const& st)
	{
		m_active.store(st.active_transfers, std::memory_order_relaxed);
		m_submitted.store(st.submitted, std::memory_order_relaxed);
		m_completed.store(st.completed, std::memory_order_relaxed);
		m_failed.store(st.failed, std::memory_order_relaxed);
		m_cancelled.store(st.cancelled, std::memory_order_relaxed);
		m_state.store(std::uint8_t(st.state), std::memory_order_release);
	}

	agent_stats agent_shared_state::stats() const
	{
		agent_stats ret;
		ret.state = agent_state(m_state.load(std::memory_order_acquire));
		ret.active_transfers = m_active.load(std::memory_order_relaxed);
		ret.submitted = m_submitted.load(std::memory_order_relaxed);
		ret.completed = m_completed.load(std::memory_order_relaxed);
		ret.failed = m_failed.load(std::memory_order_relaxed);
		ret.cancelled = m_cancelled.load(std::memory_order_relaxed);
		return ret;
	}
}

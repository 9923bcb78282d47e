/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_AGENT_SHARED_STATE_HPP_INCLUDED
#define CURLAGENT_AGENT_SHARED_STATE_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_handle.hpp"
#include "curlagent/error_code.hpp"
#include "curlagent/aux_/agent_logger.hpp"
#include "curlagent/aux_/message.hpp"
#include "curlagent/aux_/message_queue.hpp"
#include "curlagent/aux_/notify.hpp"

#include <atomic>
#include <cstdint>

namespace curlagent::aux {

	// the state behind every copy of an agent_handle. The worker only holds
	// a weak reference to it, to publish its statistics and its termination.
	// When the last handle goes away, the destructor asks the worker to
	// close.
	struct CURLAGENT_EXTRA_EXPORT agent_shared_state
	{
		agent_shared_state(message_sender<agent_message> tx
			, notify_sender wake, agent_logger log);
		~agent_shared_state();

		agent_shared_state(agent_shared_state const&) = delete;
		agent_shared_state& operator=(agent_shared_state const&) = delete;

		// queues the message for the worker and wakes it up. Fails with
		// errors::internal if the worker has terminated
		void send_message(agent_message m, error_code& ec);

		bool terminated() const { return m_terminated.load(std::memory_order_acquire); }

		// called by the worker, once, right before it exits
		void set_terminated();

		void publish(agent_stats const& st);
		agent_stats stats() const;

	private:

		message_sender<agent_message> m_sender;
		notify_sender m_wake;

		std::atomic<bool> m_terminated{false};

		std::atomic<std::uint8_t> m_state{std::uint8_t(agent_state::running)};
		std::atomic<std::size_t> m_active{0};
		std::atomic<std::uint64_t> m_submitted{0};
		std::atomic<std::uint64_t> m_completed{0};
		std::atomic<std::uint64_t> m_failed{0};
		std::atomic<std::uint64_t> m_cancelled{0};

		agent_logger m_logger;
	};
}

#endif

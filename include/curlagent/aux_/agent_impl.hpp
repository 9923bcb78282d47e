/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_AGENT_IMPL_HPP_INCLUDED
#define CURLAGENT_AGENT_IMPL_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_handle.hpp"
#include "curlagent/error_code.hpp"
#include "curlagent/time.hpp"
#include "curlagent/transfer_engine.hpp"
#include "curlagent/aux_/agent_logger.hpp"
#include "curlagent/aux_/message.hpp"
#include "curlagent/aux_/message_queue.hpp"
#include "curlagent/aux_/notify.hpp"
#include "curlagent/aux_/token_table.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace curlagent::aux {

	struct agent_shared_state;

	// the worker of an agent. It's created on the thread calling
	// create_agent() and from then on only touched by the worker thread.
	// Nothing in here is guarded by a lock.
	struct CURLAGENT_EXTRA_EXPORT agent
	{
		agent(std::unique_ptr<transfer_engine> engine
			, message_receiver<agent_message> messages
			, notify_receiver wake
			, std::weak_ptr<agent_shared_state> shared
			, agent_logger logger
			, milliseconds default_timeout);

		// publishes the termination to any remaining handles
		~agent();

		agent(agent const&) = delete;
		agent& operator=(agent const&) = delete;

		// runs the loop until a close was requested and no transfer is
		// active. Returns the engine error that stopped it early, if any.
		// Exceptions thrown by handlers propagate
		error_code run();

		// the body of the worker thread. Runs the loop and logs the reason it
		// stopped early
		void thread_fun();

	private:

		void poll_messages(error_code& ec);
		void handle_message(agent_message m, error_code& ec);
		void dispatch(error_code& ec);
		void complete_request(token_t token, error_code& ec);
		void fail_request(token_t token, error_code const& result, error_code& ec);
		void request_close();
		void publish_stats();

		message_receiver<agent_message> m_messages;
		notify_receiver m_wake;

		std::unique_ptr<transfer_engine> m_engine;

		// the active transfers, by token
		token_table<engine_handle> m_requests;

		// the results collected from the engine in one dispatch
		std::vector<std::pair<token_t, error_code>> m_events;

		std::weak_ptr<agent_shared_state> m_shared;
		agent_logger m_logger;
		milliseconds m_default_timeout;

		agent_stats m_stats;
		agent_state m_state = agent_state::running;
		bool m_close_requested = false;
	};
}

#endif

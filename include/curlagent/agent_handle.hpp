/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_AGENT_HANDLE_HPP_INCLUDED
#define CURLAGENT_AGENT_HANDLE_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/error_code.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>

namespace curlagent {

	class transfer;

namespace aux {
	struct agent_shared_state;
}

	// identifies one active transfer of an agent. Tokens are small integers
	// and are recycled once the transfer completes, fails or is cancelled.
	using token_t = std::size_t;

	// the token of a transfer that has not been registered (yet)
	constexpr token_t invalid_token = (std::numeric_limits<token_t>::max)();

	// the lifecycle of the agent's worker
	enum class agent_state : std::uint8_t
	{
		// accepting and executing transfers
		running,

		// a close was requested (explicitly, or by releasing every handle)
		// while transfers were still active
		close_requested,

		// no new messages are read, the remaining transfers are being
		// finished
		draining,

		// the worker has exited. Every handle operation fails with
		// errors::internal
		terminated
	};

	CURLAGENT_EXPORT char const* to_string(agent_state s);

	// counters published by the worker. They are updated once per loop
	// iteration, so they may lag behind handle operations slightly.
	struct CURLAGENT_EXPORT agent_stats
	{
		// the number of transfers currently registered with the engine
		std::size_t active_transfers = 0;

		// the number of transfers registered since the agent started
		std::uint64_t submitted = 0;

		// the number of on_complete() calls
		std::uint64_t completed = 0;

		// the number of on_fail() calls
		std::uint64_t failed = 0;

		// the number of transfers removed by cancel_request()
		std::uint64_t cancelled = 0;

		agent_state state = agent_state::running;
	};

	// The agent_handle is the front of an agent, used by any thread to submit
	// transfers to its worker, and to cancel or resume them. Handles are
	// cheap to copy, and every copy refers to the same agent. None of the
	// operations block.
	//
	// When the last handle referring to an agent is destroyed, the worker is
	// asked to close. It keeps running until its active transfers have
	// finished, then exits.
	class CURLAGENT_EXPORT agent_handle
	{
	public:

		// creates an empty handle. Every operation on it fails with
		// errors::internal
		agent_handle() = default;
		explicit agent_handle(std::shared_ptr<aux::agent_shared_state> s);

		agent_handle(agent_handle const&) = default;
		agent_handle(agent_handle&&) noexcept = default;
		agent_handle& operator=(agent_handle const&) = default;
		agent_handle& operator=(agent_handle&&) noexcept = default;
		~agent_handle();

		// hands the transfer over to the worker. Ownership of the transfer
		// moves to the agent even if the call fails. Once the transfer is
		// registered its handler is given a token, and it receives exactly one
		// of on_complete() or on_fail(), unless it's cancelled first.
		void begin_execute(std::unique_ptr<transfer> t, error_code& ec);
		void begin_execute(std::unique_ptr<transfer> t);

		// removes the transfer with the given token. Neither on_complete()
		// nor on_fail() is called for it. If the token does not refer to an
		// active transfer (for instance because it completed already) the
		// request is ignored.
		void cancel_request(token_t token, error_code& ec);
		void cancel_request(token_t token);

		// resumes a transfer whose handler paused it by returning
		// transfer_handler::pause_write from on_write().
		void unpause_write(token_t token, error_code& ec);
		void unpause_write(token_t token);

		// asks the worker to exit once its active transfers are done. New
		// transfers submitted after this are still executed if they reach the
		// worker before it exits.
		void close(error_code& ec);
		void close();

		// returns true if this handle refers to an agent
		bool is_valid() const { return bool(m_impl); }

		// returns true once the worker has exited, or if the handle is empty
		bool is_terminated() const;

		agent_stats stats() const;

	private:
		std::shared_ptr<aux::agent_shared_state> m_impl;
	};
}

#endif

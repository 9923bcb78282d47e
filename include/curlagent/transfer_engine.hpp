/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_TRANSFER_ENGINE_HPP_INCLUDED
#define CURLAGENT_TRANSFER_ENGINE_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_handle.hpp"
#include "curlagent/agent_params.hpp"
#include "curlagent/error_code.hpp"
#include "curlagent/time.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace curlagent {

	class transfer;

	// a descriptor the engine waits on in addition to its own
	struct wait_fd
	{
		// the events to wait for
		static constexpr short in = 0x1;

		int fd = -1;
		short events = 0;

		// set by transfer_engine::wait() to the events that fired
		short revents = 0;
	};

	// identifies a transfer registered with an engine. It stays valid until
	// the transfer is removed
	using engine_handle = transfer*;

	// the protocol side of an agent. An engine executes any number of
	// transfers concurrently and reports each one as done exactly once. All
	// functions are called from the agent's worker thread only.
	struct CURLAGENT_EXPORT transfer_engine
	{
		// starts executing the transfer. On success, ownership moves to the
		// engine and t is left empty. On failure t is left untouched
		virtual engine_handle add(std::unique_ptr<transfer>& t, error_code& ec) = 0;

		// stops a transfer and returns it
		virtual std::unique_ptr<transfer> remove(engine_handle h, error_code& ec) = 0;

		// associates the token with the transfer. It's reported back by
		// drain_events()
		virtual void bind_token(engine_handle h, token_t t, error_code& ec) = 0;
		virtual token_t token_of(engine_handle h, error_code& ec) const = 0;

		// continues a response body paused by its handler
		virtual void resume_write(engine_handle h, error_code& ec) = 0;

		// performs all I/O that can be done without blocking
		virtual void progress(error_code& ec) = 0;

		// calls f once for every transfer that finished since the last call.
		// The transfers are still registered when f is called.
		virtual void drain_events(std::function<void(token_t, error_code const&)> const& f) = 0;

		// the longest the engine may wait before progress() must be called
		// again. An empty optional means the engine has no deadline
		virtual std::optional<milliseconds> suggested_timeout(error_code& ec) = 0;

		// blocks until one of the engine's own descriptors or one of extra is
		// ready, or the timeout expires
		virtual void wait(std::vector<wait_fd>& extra, milliseconds timeout
			, error_code& ec) = 0;

		// removes every remaining transfer and releases the engine's
		// resources. No other function is called after this
		virtual void shutdown(error_code& ec) = 0;

		virtual ~transfer_engine();
	};

	// creates the default engine, backed by a libcurl multi handle. Throws
	// system_error if libcurl cannot be initialized or is too old
	CURLAGENT_EXPORT std::unique_ptr<transfer_engine> make_curl_engine(
		engine_settings const& settings);
}

#endif

/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_AGENT_PARAMS_HPP_INCLUDED
#define CURLAGENT_AGENT_PARAMS_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/time.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace curlagent {

	// severity of a message emitted by the agent. Messages below
	// agent_params::min_log_level are discarded before they are formatted.
	enum class log_level : std::uint8_t
	{
		trace,
		debug,
		info,
		warning,
		error,

		// disables logging entirely
		none
	};

	CURLAGENT_EXPORT char const* to_string(log_level l);

	// options applied to the libcurl multi handle of the default engine.
	struct CURLAGENT_EXPORT engine_settings
	{
		// the max number of connections to a single host. 0 means no limit
		long max_host_connections = 0;

		// the max number of simultaneously open connections. 0 means no limit
		long max_total_connections = 0;

		// when true, transfers to the same host share an HTTP/2 connection
		bool multiplex = true;

		// the max number of concurrent streams on one HTTP/2 connection
		long max_concurrent_streams = 100;
	};

	// the parameters used to create an agent. See create_agent().
	struct CURLAGENT_EXPORT agent_params
	{
		// the name given to the worker thread, where the platform supports it
		std::string thread_name = "curl agent";

		// the upper bound of a single wait in the worker loop. The engine may
		// ask for a shorter one, never a longer one
		milliseconds default_timeout{1000};

		// messages below this level are dropped
		log_level min_log_level = log_level::info;

		// receives every formatted log line. It is called on the worker
		// thread (and on the thread of a handle operation that fails). When
		// empty, log lines are printed to stderr.
		std::function<void(log_level, char const*)> log_handler;

		// configuration of the default libcurl engine. Ignored when a custom
		// engine is passed to create_agent()
		engine_settings engine;
	};
}

#endif

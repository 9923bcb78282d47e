/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_AGENT_HPP_INCLUDED
#define CURLAGENT_AGENT_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_handle.hpp"
#include "curlagent/agent_params.hpp"
#include "curlagent/error_code.hpp"
#include "curlagent/transfer.hpp"
#include "curlagent/transfer_engine.hpp"

#include <memory>

namespace curlagent {

	// starts an agent: a worker thread executing transfers on a libcurl
	// multi handle. The returned handle, and every copy of it, submits
	// transfers to that worker. If the engine, the message channel, the wake
	// notifier or the thread cannot be created, the call fails with
	// errors::setup_failure (the throwing overload throws system_error) and
	// nothing is left running.
	CURLAGENT_EXPORT agent_handle create_agent(agent_params params, error_code& ec);
	CURLAGENT_EXPORT agent_handle create_agent(agent_params params);

	// same as above, but the worker drives the given engine instead of
	// a libcurl multi handle. params.engine is ignored.
	CURLAGENT_EXPORT agent_handle create_agent(agent_params params
		, std::unique_ptr<transfer_engine> engine, error_code& ec);
	CURLAGENT_EXPORT agent_handle create_agent(agent_params params
		, std::unique_ptr<transfer_engine> engine);
}

#endif

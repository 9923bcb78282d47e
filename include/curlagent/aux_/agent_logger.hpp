/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_AGENT_LOGGER_HPP_INCLUDED
#define CURLAGENT_AGENT_LOGGER_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_params.hpp"

#include <functional>

namespace curlagent::aux {

	// formats log lines for one agent and hands them to the configured
	// handler. Shared by the worker and the handle state, both of which
	// only read it after construction.
	struct CURLAGENT_EXTRA_EXPORT agent_logger
	{
		agent_logger() = default;
		agent_logger(log_level min_level
			, std::function<void(log_level, char const*)> handler);

#ifndef CURLAGENT_DISABLE_LOGGING
		bool should_log(log_level l) const
		{ return l >= m_min_level && m_min_level != log_level::none; }

		void log(log_level l, char const* fmt, ...) const noexcept CURLAGENT_FORMAT(3,4);
#else
		bool should_log(log_level) const { return false; }
		void log(log_level, char const*, ...) const noexcept {}
#endif

	private:
		log_level m_min_level = log_level::info;
		std::function<void(log_level, char const*)> m_handler;
	};
}

#endif

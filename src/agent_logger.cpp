/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/aux_/agent_logger.hpp"

#include <cstdarg>
#include <cstdio>
#include <exception>
#include <utility>

namespace curlagent {

	char const* to_string(log_level const l)
	{
		switch (l)
		{
			case log_level::trace: return "trace";
			case log_level::debug: return "debug";
			case log_level::info: return "info";
			case log_level::warning: return "warning";
			case log_level::error: return "error";
			case log_level::none: return "none";
		}
		return "unknown";
	}

namespace aux {

	agent_logger::agent_logger(log_level const min_level
		, std::function<void(log_level, char const*)> handler)
		: m_min_level(min_level)
		, m_handler(std::move(handler))
	{}

#ifndef CURLAGENT_DISABLE_LOGGING
	void agent_logger::log(log_level const l, char const* fmt, ...) const noexcept try
	{
		if (!should_log(l)) return;

		char buf[1024];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);

		if (m_handler)
		{
			m_handler(l, buf);
			return;
		}
		std::fprintf(stderr, "[%s] %s\n", to_string(l), buf);
	}
	catch (std::exception const&) {}
#endif

}
}

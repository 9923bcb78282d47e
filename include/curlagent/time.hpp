/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_TIME_HPP_INCLUDED
#define CURLAGENT_TIME_HPP_INCLUDED

#include "curlagent/config.hpp"

#include <chrono>
#include <cstdint>

namespace curlagent {

	// the clock used for every timeout in the agent
	using clock_type = std::chrono::steady_clock;

	using time_point = clock_type::time_point;
	using time_duration = clock_type::duration;

	using milliseconds = std::chrono::milliseconds;
	using seconds = std::chrono::seconds;

	inline std::int64_t total_milliseconds(time_duration td)
	{ return std::chrono::duration_cast<milliseconds>(td).count(); }
}

#endif

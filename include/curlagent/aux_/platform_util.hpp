/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_PLATFORM_UTIL_HPP_INCLUDED
#define CURLAGENT_PLATFORM_UTIL_HPP_INCLUDED

#include "curlagent/config.hpp"

namespace curlagent::aux {

	// names the calling thread, where the platform supports it
	void set_thread_name(char const* name);

}

#endif

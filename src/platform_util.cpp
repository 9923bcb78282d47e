/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/config.hpp"
#include "curlagent/aux_/platform_util.hpp"

#if CURLAGENT_HAS_THREAD_NAME
#include <pthread.h>
#include <cstring>
#endif

namespace curlagent::aux {

	void set_thread_name(char const* name)
	{
		CURLAGENT_UNUSED(name);
#if CURLAGENT_HAS_THREAD_NAME
		// linux limits thread names to 16 bytes, including the terminator
		char buf[16];
		std::strncpy(buf, name, sizeof(buf) - 1);
		buf[sizeof(buf) - 1] = '\0';
#ifdef CURLAGENT_APPLE
		pthread_setname_np(buf);
#else
		pthread_setname_np(pthread_self(), buf);
#endif
#endif
	}
}

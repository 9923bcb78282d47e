/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_CONFIG_HPP_INCLUDED
#define CURLAGENT_CONFIG_HPP_INCLUDED

#include "curlagent/export.hpp"

// ==== platform ===

#if defined __linux__
#define CURLAGENT_LINUX
#define CURLAGENT_USE_NOTIFY_PIPE 1
#define CURLAGENT_HAS_THREAD_NAME 1

#elif defined __APPLE__ && defined __MACH__
#define CURLAGENT_APPLE
#define CURLAGENT_USE_NOTIFY_PIPE 1
#define CURLAGENT_HAS_THREAD_NAME 1

#elif defined __FreeBSD__ || defined __NetBSD__ || defined __OpenBSD__ \
	|| defined __DragonFly__
#define CURLAGENT_BSD
#define CURLAGENT_USE_NOTIFY_PIPE 1

#elif defined _WIN32
#define CURLAGENT_WINDOWS
// there is no pipe that can be handed to curl_multi_poll() as an extra
// socket on windows. The agent falls back to timeout-only waking
#define CURLAGENT_USE_NOTIFY_PIPE 0

#elif defined __unix__
#define CURLAGENT_USE_NOTIFY_PIPE 1

#else

#ifdef _MSC_VER
#pragma message ( "unknown OS, polling interruption disabled" )
#else
#warning "unknown OS, polling interruption disabled"
#endif

#endif

#ifndef CURLAGENT_USE_NOTIFY_PIPE
#define CURLAGENT_USE_NOTIFY_PIPE 0
#endif

#ifndef CURLAGENT_HAS_THREAD_NAME
#define CURLAGENT_HAS_THREAD_NAME 0
#endif

#define CURLAGENT_UNUSED(x) (void)(x)

#if defined __GNUC__ || defined __clang__
#define CURLAGENT_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define CURLAGENT_FORMAT(fmt, ellipsis)
#endif

#if defined CURLAGENT_DEBUG && !defined CURLAGENT_USE_ASSERTS
#define CURLAGENT_USE_ASSERTS 1
#endif

#ifndef CURLAGENT_USE_ASSERTS
#define CURLAGENT_USE_ASSERTS 0
#endif

#endif // CURLAGENT_CONFIG_HPP_INCLUDED

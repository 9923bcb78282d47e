/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_ASSERT_HPP_INCLUDED
#define CURLAGENT_ASSERT_HPP_INCLUDED

#include "curlagent/config.hpp"

#ifdef _MSC_VER
#define CURLAGENT_WHILE_0  \
	__pragma( warning(push) ) \
	__pragma( warning(disable:4127) ) \
	while (false) \
	__pragma( warning(pop) )
#else
#define CURLAGENT_WHILE_0 while (false)
#endif

namespace curlagent {

// internal
CURLAGENT_EXPORT void assert_print(char const* fmt, ...) CURLAGENT_FORMAT(1,2);

// internal
CURLAGENT_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function, char const* val, int kind = 0);

}

#if CURLAGENT_USE_ASSERTS

#define CURLAGENT_ASSERT_PRECOND(x) \
	do { if (x) {} else curlagent::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 1); } CURLAGENT_WHILE_0

#define CURLAGENT_ASSERT(x) \
	do { if (x) {} else curlagent::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 0); } CURLAGENT_WHILE_0

#else // CURLAGENT_USE_ASSERTS

#define CURLAGENT_ASSERT_PRECOND(a) do {} CURLAGENT_WHILE_0
#define CURLAGENT_ASSERT(a) do {} CURLAGENT_WHILE_0

#endif // CURLAGENT_USE_ASSERTS

#endif // CURLAGENT_ASSERT_HPP_INCLUDED

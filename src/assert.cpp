/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/config.hpp"
#include "curlagent/assert.hpp"

#if CURLAGENT_USE_ASSERTS

#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdarg>
#include <cstdio>
#include <csignal>

#if defined __GNUC__ && defined CURLAGENT_LINUX
#include <cxxabi.h>
#include <execinfo.h>

namespace {

std::string demangle(char const* name)
{
	// this is needed on linux
	char const* start = std::strchr(name, '(');
	if (start != nullptr) ++start;
	else start = name;

	char const* end = std::strchr(start, '+');
	if (end) while (end > start && *(end - 1) == ' ') --end;

	std::string in;
	if (end == nullptr) in.assign(start);
	else in.assign(start, end);

	std::size_t len;
	int status;
	char* unmangled = ::abi::__cxa_demangle(in.c_str(), nullptr, &len, &status);
	if (unmangled == nullptr) return in;
	std::string ret(unmangled);
	std::free(unmangled);
	return ret;
}

void print_backtrace(char* out, int len, int max_depth)
{
	void* stack[50];
	int const size = ::backtrace(stack, 50);
	char** symbols = ::backtrace_symbols(stack, size);

	for (int i = 1; i < size && len > 0; ++i)
	{
		int const ret = std::snprintf(out, std::size_t(len), "%d: %s\n", i, demangle(symbols[i]).c_str());
		if (ret < 0) break;
		out += ret;
		len -= ret;
		if (i - 1 == max_depth && max_depth > 0) break;
	}

	std::free(symbols);
}

}

#else

namespace {

void print_backtrace(char* out, int len, int)
{
	out[0] = 0;
	std::strncat(out, "<not supported>", std::size_t(len) - 1);
}

}

#endif

namespace curlagent {

CURLAGENT_FORMAT(1,2)
void assert_print(char const* fmt, ...)
{
	FILE* out = stderr;
	va_list va;
	va_start(va, fmt);
	std::vfprintf(out, fmt, va);
	va_end(va);
}

// we deliberately don't want asserts to be marked as no-return, since that
// would trigger warnings in debug builds of any code coming after the assert
#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wmissing-noreturn"
#endif

void assert_fail(char const* expr, int line
	, char const* file, char const* function, char const* value, int kind)
{
	char stack[8192];
	stack[0] = '\0';
	print_backtrace(stack, sizeof(stack), 0);

	char const* message = "assertion failed. Please file a bugreport "
		"and include the following information:\n";

	switch (kind)
	{
		case 1:
			message = "A precondition of a curlagent function has been violated.\n"
				"This indicates a bug in the client application using curlagent\n";
	}

	assert_print("%s\n"
		"file: '%s'\n"
		"line: %d\n"
		"function: %s\n"
		"expression: %s\n"
		"%s%s\n"
		"stack:\n"
		"%s\n"
		, message
		, file, line, function, expr
		, value ? value : "", value ? "\n" : ""
		, stack);

	// send SIGABRT to the current process
	// to break into the debugger
	std::raise(SIGABRT);
	std::abort();
}

#ifdef __clang__
#pragma clang diagnostic pop
#endif

}

#else

namespace curlagent {

// these are just here to make it possible for a client that built with debug
// enabled to be able to link against a release build (just possible, not
// necessarily supported)
CURLAGENT_FORMAT(1,2)
void assert_print(char const*, ...) {}
void assert_fail(char const*, int, char const*
	, char const*, char const*, int) {}

}

#endif

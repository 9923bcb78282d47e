/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_ERROR_CODE_HPP_INCLUDED
#define CURLAGENT_ERROR_CODE_HPP_INCLUDED

#include "curlagent/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace curlagent {

	namespace errors
	{
		// curlagent uses boost.system's ``error_code`` class to represent
		// errors. curlagent has its own error category curlagent_category()
		// with the error codes defined by error_code_enum. Errors reported by
		// libcurl itself are in curl_easy_category() and curl_multi_category().
		enum error_code_enum
		{
			// Not an error
			no_error = 0,
			// the engine, the message channel, the wake notifier or the worker
			// thread could not be set up. The agent was not created
			setup_failure,
			// the agent has terminated, or was never created. The operation
			// was not queued
			internal,
			// a transfer failed without a more specific libcurl error
			transfer_failure,
			// the token does not refer to an active transfer
			unknown_token,

			// the number of error codes
			error_code_max
		};

		// hidden
		CURLAGENT_EXPORT boost::system::error_code make_error_code(error_code_enum e);

	} // namespace errors

	// return the instance of the curlagent_error_category which
	// maps curlagent error codes to human readable error messages.
	CURLAGENT_EXPORT boost::system::error_category& curlagent_category();

	// the category of ``CURLcode`` values, reported for individual
	// transfers
	CURLAGENT_EXPORT boost::system::error_category& curl_easy_category();

	// the category of ``CURLMcode`` values, reported by the multi handle
	CURLAGENT_EXPORT boost::system::error_category& curl_multi_category();

	using boost::system::error_code;
	using boost::system::error_condition;
	using boost::system::system_error;

	// internal
	using boost::system::generic_category;
	using boost::system::system_category;
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<curlagent::errors::error_code_enum>
	{ static const bool value = true; };
} }

#endif

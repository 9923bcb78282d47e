/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/config.hpp"
#include "curlagent/error_code.hpp"

#include <curl/curl.h>

namespace curlagent {

	struct curlagent_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* curlagent_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "curlagent";
	}

	std::string curlagent_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"failed to set up the curl agent",
			"curl agent is not running",
			"transfer failed",
			"unknown transfer token",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	struct curl_easy_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "curl"; }
		std::string message(int ev) const override
		{ return curl_easy_strerror(static_cast<CURLcode>(ev)); }
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	struct curl_multi_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "curl multi"; }
		std::string message(int ev) const override
		{ return curl_multi_strerror(static_cast<CURLMcode>(ev)); }
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	boost::system::error_category& curlagent_category()
	{
		static curlagent_error_category curlagent_category;
		return curlagent_category;
	}

	boost::system::error_category& curl_easy_category()
	{
		static curl_easy_error_category category;
		return category;
	}

	boost::system::error_category& curl_multi_category()
	{
		static curl_multi_error_category category;
		return category;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, curlagent_category()};
		}
	}
}

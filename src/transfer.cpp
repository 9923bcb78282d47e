/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/transfer.hpp"
#include "curlagent/assert.hpp"
#include "curlagent/aux_/throw.hpp"

#include <new>
#include <stdexcept>
#include <utility>

namespace curlagent {

	transfer_handler::~transfer_handler() = default;

	std::size_t transfer_handler::on_header(char const*, std::size_t const len)
	{ return len; }

	std::size_t transfer_handler::on_write(char const*, std::size_t const len)
	{ return len; }

	std::size_t transfer_handler::on_read(char*, std::size_t)
	{ return 0; }

	void transfer_handler::resume_write(error_code& ec)
	{
		token_t const t = token();
		agent_handle owner = owning_handle();
		if (t == invalid_token || !owner.is_valid())
		{
			ec = errors::unknown_token;
			return;
		}
		owner.unpause_write(t, ec);
	}

	void transfer_handler::resume_write()
	{
		error_code ec;
		resume_write(ec);
		if (ec) aux::throw_ex<system_error>(ec);
	}

	void transfer_handler::cancel(error_code& ec)
	{
		token_t const t = token();
		agent_handle owner = owning_handle();
		if (t == invalid_token || !owner.is_valid())
		{
			ec = errors::unknown_token;
			return;
		}
		owner.cancel_request(t, ec);
	}

	agent_handle transfer_handler::owning_handle() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_owner;
	}

	void transfer_handler::bind_owning_handle(agent_handle h)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_owner = std::move(h);
	}

	void transfer_handler::bind_token(token_t const t)
	{
		m_token.store(t, std::memory_order_release);
	}

	transfer::transfer(std::shared_ptr<transfer_handler> h)
		: m_handler(std::move(h))
	{
		CURLAGENT_ASSERT_PRECOND(m_handler);

		// callbacks to curl (must not throw exceptions)
		m_handle.setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));
		m_handle.setopt(CURLOPT_HEADERFUNCTION, &transfer::header_callback);
		m_handle.setopt(CURLOPT_WRITEDATA, static_cast<void*>(this));
		m_handle.setopt(CURLOPT_WRITEFUNCTION, &transfer::write_callback);
		m_handle.setopt(CURLOPT_READDATA, static_cast<void*>(this));
		m_handle.setopt(CURLOPT_READFUNCTION, &transfer::read_callback);

		// the agent is multi-threaded, curl must not install signal handlers
		m_handle.setopt(CURLOPT_NOSIGNAL, 1L);
	}

	transfer::~transfer() = default;

	void transfer::set_url(std::string const& url, error_code& ec)
	{
		m_handle.setopt(CURLOPT_URL, url.c_str(), ec);
	}

	void transfer::set_url(std::string const& url)
	{
		m_handle.setopt(CURLOPT_URL, url.c_str());
	}

	long transfer::response_code() const
	{
		long code = 0;
		if (curl_easy_getinfo(m_handle.get(), CURLINFO_RESPONSE_CODE, &code) != CURLE_OK)
			return 0;
		return code;
	}

namespace {

	// return a value different from the input size to make curl fail the
	// transfer
	template <typename Fun>
	std::size_t invoke_hook(error_code& status, std::size_t const len, Fun&& f)
	{
		try
		{
			return f();
		}
		catch (std::bad_alloc const&)
		{
			status = make_error_code(boost::system::errc::not_enough_memory);
		}
		catch (system_error const& e)
		{
			status = e.code();
		}
		catch (std::exception const&)
		{
			status = errors::transfer_failure;
		}
		return len + 1;
	}
}

	std::size_t transfer::header_callback(char* ptr, std::size_t const size
		, std::size_t const nmemb, void* userdata)
	{
		CURLAGENT_ASSERT(userdata);
		auto* self = static_cast<transfer*>(userdata);
		std::size_t const len = size * nmemb;
		return invoke_hook(self->m_callback_error, len
			, [&] { return self->m_handler->on_header(ptr, len); });
	}

	std::size_t transfer::write_callback(char* ptr, std::size_t const size
		, std::size_t const nmemb, void* userdata)
	{
		CURLAGENT_ASSERT(userdata);
		auto* self = static_cast<transfer*>(userdata);
		std::size_t const len = size * nmemb;
		return invoke_hook(self->m_callback_error, len
			, [&] { return self->m_handler->on_write(ptr, len); });
	}

	std::size_t transfer::read_callback(char* ptr, std::size_t const size
		, std::size_t const nmemb, void* userdata)
	{
		CURLAGENT_ASSERT(userdata);
		auto* self = static_cast<transfer*>(userdata);
		std::size_t const len = size * nmemb;
		try
		{
			return self->m_handler->on_read(ptr, len);
		}
		catch (system_error const& e)
		{
			self->m_callback_error = e.code();
		}
		catch (std::exception const&)
		{
			self->m_callback_error = errors::transfer_failure;
		}
		return CURL_READFUNC_ABORT;
	}
}

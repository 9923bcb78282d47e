/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_TRANSFER_HPP_INCLUDED
#define CURLAGENT_TRANSFER_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_handle.hpp"
#include "curlagent/error_code.hpp"
#include "curlagent/aux_/curl_handle_wrappers.hpp"

#include <curl/curl.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace curlagent {

	// receives the body bytes and the outcome of one transfer. Subclasses
	// implement on_complete() and on_fail(), and usually on_write().
	//
	// The body hooks and the outcome callbacks are invoked on the agent's
	// worker thread. An exception thrown by a body hook aborts that transfer
	// only. An exception thrown by on_complete() or on_fail() terminates the
	// agent.
	struct CURLAGENT_EXPORT transfer_handler
	{
		// return this from on_write() to pause the response body. The
		// transfer stays paused until resume_write() (or
		// agent_handle::unpause_write()) is called
		static constexpr std::size_t pause_write = CURL_WRITEFUNC_PAUSE;

		transfer_handler() = default;
		transfer_handler(transfer_handler const&) = delete;
		transfer_handler& operator=(transfer_handler const&) = delete;
		virtual ~transfer_handler();

		// one response header line, including its line terminator. Return
		// the number of bytes consumed. Anything other than len aborts the
		// transfer
		virtual std::size_t on_header(char const* data, std::size_t len);

		// a chunk of the response body. Return the number of bytes consumed,
		// or pause_write
		virtual std::size_t on_write(char const* data, std::size_t len);

		// fill in up to len bytes of request body. Return the number of bytes
		// written, 0 signals the end of the body
		virtual std::size_t on_read(char* buffer, std::size_t len);

		// the transfer finished successfully
		virtual void on_complete() = 0;

		// the transfer failed. ec is in curl_easy_category() when libcurl
		// reported the failure
		virtual void on_fail(error_code const& ec) = 0;

		// resumes a response body paused by returning pause_write from
		// on_write(). Fails with errors::unknown_token if the transfer has not
		// been registered by an agent
		void resume_write(error_code& ec);
		void resume_write();

		// cancels this transfer through the agent it was submitted to.
		void cancel(error_code& ec);

		// the token of this transfer, or invalid_token if it has not been
		// registered yet
		token_t token() const { return m_token.load(std::memory_order_acquire); }

		// the handle this transfer was submitted through
		agent_handle owning_handle() const;

		// internal
		void bind_owning_handle(agent_handle h);
		void bind_token(token_t t);

	private:
		mutable std::mutex m_mutex;
		agent_handle m_owner;
		std::atomic<token_t> m_token{invalid_token};
	};

	// one libcurl easy handle, bound to a handler. The easy handle can be
	// configured through handle() or setopt() before the transfer is passed
	// to agent_handle::begin_execute(). After that, it's owned by the agent
	// and must not be touched by other threads.
	class CURLAGENT_EXPORT transfer
	{
	public:
		// throws system_error if the easy handle cannot be created
		explicit transfer(std::shared_ptr<transfer_handler> h);
		~transfer();

		transfer(transfer const&) = delete;
		transfer& operator=(transfer const&) = delete;

		[[nodiscard]] CURL* handle() const noexcept { return m_handle.get(); }
		[[nodiscard]] transfer_handler& handler() const noexcept { return *m_handler; }

		void set_url(std::string const& url, error_code& ec);
		void set_url(std::string const& url);

		template<typename T>
		void setopt(CURLoption option, T value, error_code& ec)
		{ m_handle.setopt(option, value, ec); }

		template<typename T>
		void setopt(CURLoption option, T value)
		{ m_handle.setopt(option, value); }

		// the error recorded when a body hook threw. libcurl only reports
		// that the callback failed
		error_code const& callback_error() const { return m_callback_error; }

		// the HTTP response code, or 0 if none has been received
		long response_code() const;

	private:

		static std::size_t header_callback(char* ptr, std::size_t size
			, std::size_t nmemb, void* userdata);
		static std::size_t write_callback(char* ptr, std::size_t size
			, std::size_t nmemb, void* userdata);
		static std::size_t read_callback(char* ptr, std::size_t size
			, std::size_t nmemb, void* userdata);

		aux::curl_easy_handle m_handle;
		std::shared_ptr<transfer_handler> m_handler;
		error_code m_callback_error;
	};
}

#endif

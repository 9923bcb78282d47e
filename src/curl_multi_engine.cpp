/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/aux_/curl_multi_engine.hpp"
#include "curlagent/transfer.hpp"
#include "curlagent/assert.hpp"
#include "curlagent/aux_/throw.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace curlagent {

	transfer_engine::~transfer_engine() = default;

	std::unique_ptr<transfer_engine> make_curl_engine(engine_settings const& settings)
	{
		return std::make_unique<aux::curl_multi_engine>(settings);
	}

namespace aux {

namespace {

	// the token is stored off by one, so that a handle without a token
	// (CURLOPT_PRIVATE is null) decodes to invalid_token
	void* encode_token(token_t const t)
	{
		return reinterpret_cast<void*>(static_cast<std::uintptr_t>(t + 1));
	}

	token_t decode_token(char const* p)
	{
		return static_cast<token_t>(reinterpret_cast<std::uintptr_t>(p)) - 1;
	}

	void check_version()
	{
		// curl_multi_poll() was added in 7.66.0
		curl_version_info_data const* ver = curl_version_info(CURLVERSION_NOW);
		if (!ver || ver->version_num < 0x074200)
		{
			throw_ex<system_error>(errors::setup_failure
				, "libcurl 7.66.0+ required for curl_multi_poll, found: "
				+ std::string(ver ? ver->version : "unknown"));
		}
	}

	// the multi handle can only be created after global init
	curl_multi_handle make_multi_handle()
	{
		curl_global_setup();
		check_version();
		return curl_multi_handle();
	}
}

	void curl_global_setup()
	{
		// Ensure curl is initialized globally (thread-safe with std::once_flag)
		static std::once_flag curl_init_flag;
		std::call_once(curl_init_flag, []() {
			CURLcode const res = curl_global_init(CURL_GLOBAL_ALL);
			if (res != CURLE_OK)
				throw_ex<system_error>(error_code(res, curl_easy_category()), "curl_global_init");
		});
	}

	curl_multi_engine::curl_multi_engine(engine_settings const& settings)
		: m_multi(make_multi_handle())
	{
		if (settings.max_host_connections > 0)
			m_multi.setopt(CURLMOPT_MAX_HOST_CONNECTIONS, settings.max_host_connections);

		if (settings.max_total_connections > 0)
			m_multi.setopt(CURLMOPT_MAX_TOTAL_CONNECTIONS, settings.max_total_connections);

		if (settings.multiplex)
		{
			m_multi.setopt(CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
#if LIBCURL_VERSION_NUM >= 0x074300
			// CURLMOPT_MAX_CONCURRENT_STREAMS was added in 7.67.0
			if (settings.max_concurrent_streams > 0)
				m_multi.setopt(CURLMOPT_MAX_CONCURRENT_STREAMS, settings.max_concurrent_streams);
#endif
		}
		else
		{
			m_multi.setopt(CURLMOPT_PIPELINING, CURLPIPE_NOTHING);
		}
	}

	curl_multi_engine::~curl_multi_engine()
	{
		// the easy handles must leave the multi handle before either is
		// cleaned up
		for (auto& t : m_transfers)
		{
			error_code ignore;
			m_multi.remove_handle(t.first, ignore);
		}
	}

	engine_handle curl_multi_engine::add(std::unique_ptr<transfer>& t, error_code& ec)
	{
		CURLAGENT_ASSERT_PRECOND(t);
		m_multi.add_handle(t->handle(), ec);
		if (ec) return nullptr;

		engine_handle const h = t.get();
		m_transfers.emplace(t->handle(), std::move(t));
		return h;
	}

	std::unique_ptr<transfer> curl_multi_engine::remove(engine_handle const h, error_code& ec)
	{
		auto const it = m_transfers.find(h->handle());
		if (it == m_transfers.end())
		{
			ec = errors::unknown_token;
			return {};
		}

		m_multi.remove_handle(h->handle(), ec);
		std::unique_ptr<transfer> ret = std::move(it->second);
		m_transfers.erase(it);
		return ret;
	}

	void curl_multi_engine::bind_token(engine_handle const h, token_t const t, error_code& ec)
	{
		CURLcode const res = curl_easy_setopt(h->handle(), CURLOPT_PRIVATE, encode_token(t));
		if (res != CURLE_OK) ec.assign(res, curl_easy_category());
	}

	token_t curl_multi_engine::token_of(engine_handle const h, error_code& ec) const
	{
		char* priv = nullptr;
		CURLcode const res = curl_easy_getinfo(h->handle(), CURLINFO_PRIVATE, &priv);
		if (res != CURLE_OK)
		{
			ec.assign(res, curl_easy_category());
			return invalid_token;
		}
		return decode_token(priv);
	}

	void curl_multi_engine::resume_write(engine_handle const h, error_code& ec)
	{
		CURLcode const res = curl_easy_pause(h->handle(), CURLPAUSE_RECV_CONT);
		if (res != CURLE_OK) ec.assign(res, curl_easy_category());
	}

	void curl_multi_engine::progress(error_code& ec)
	{
		int running = 0;
		CURLMcode const res = curl_multi_perform(m_multi.get(), &running);
		if (res != CURLM_OK) ec.assign(res, curl_multi_category());
	}

	void curl_multi_engine::drain_events(
		std::function<void(token_t, error_code const&)> const& f)
	{
		CURLMsg* msg;
		int msgs_left;
		while ((msg = curl_multi_info_read(m_multi.get(), &msgs_left)))
		{
			if (msg->msg != CURLMSG_DONE) continue;

			CURL* const easy = msg->easy_handle;
			auto const it = m_transfers.find(easy);
			if (it == m_transfers.end()) continue;

			error_code token_error;
			token_t const token = token_of(it->second.get(), token_error);
			if (token_error || token == invalid_token) continue;

			error_code result;
			if (msg->data.result != CURLE_OK)
			{
				// a failing body hook is reported by curl as a write or read
				// error. The hook's own error is more useful
				result = it->second->callback_error();
				if (!result) result.assign(msg->data.result, curl_easy_category());
			}
			f(token, result);
		}
	}

	std::optional<milliseconds> curl_multi_engine::suggested_timeout(error_code& ec)
	{
		long timeout_ms = -1;
		CURLMcode const res = curl_multi_timeout(m_multi.get(), &timeout_ms);
		if (res != CURLM_OK)
		{
			ec.assign(res, curl_multi_category());
			return std::nullopt;
		}
		// -1 means curl has no timeout set
		if (timeout_ms < 0) return std::nullopt;
		return milliseconds(timeout_ms);
	}

	void curl_multi_engine::wait(std::vector<wait_fd>& extra, milliseconds const timeout
		, error_code& ec)
	{
		m_wait_fds.clear();
		for (auto const& e : extra)
		{
			curl_waitfd w{};
			w.fd = e.fd;
			w.events = (e.events & wait_fd::in) ? CURL_WAIT_POLLIN : 0;
			w.revents = 0;
			m_wait_fds.push_back(w);
		}

		int numfds = 0;
		CURLMcode const res = curl_multi_poll(m_multi.get()
			, m_wait_fds.empty() ? nullptr : m_wait_fds.data()
			, static_cast<unsigned int>(m_wait_fds.size())
			, static_cast<int>(timeout.count()), &numfds);
		if (res != CURLM_OK)
		{
			ec.assign(res, curl_multi_category());
			return;
		}

		for (std::size_t i = 0; i < extra.size(); ++i)
		{
			extra[i].revents = (m_wait_fds[i].revents & CURL_WAIT_POLLIN)
				? wait_fd::in : 0;
		}
	}

	void curl_multi_engine::shutdown(error_code& ec)
	{
		for (auto& t : m_transfers)
		{
			error_code e;
			m_multi.remove_handle(t.first, e);
			if (e && !ec) ec = e;
		}
		m_transfers.clear();

		error_code e;
		m_multi.close(e);
		if (e && !ec) ec = e;
	}
}
}

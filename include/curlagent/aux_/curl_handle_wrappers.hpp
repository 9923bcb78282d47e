/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_CURL_HANDLE_WRAPPERS_HPP_INCLUDED
#define CURLAGENT_CURL_HANDLE_WRAPPERS_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/error_code.hpp"
#include "curlagent/aux_/throw.hpp"

#include <curl/curl.h>
#include <utility>

namespace curlagent::aux {

// calls curl_global_init() once per process. Every handle constructor calls
// it, since curl_easy_init() would otherwise do it without synchronization
CURLAGENT_EXTRA_EXPORT void curl_global_setup();

// RAII wrapper for CURL easy handle
// Provides automatic resource management for curl_easy_init/cleanup
// with move semantics
class curl_easy_handle {
public:
	explicit curl_easy_handle()
		: m_handle((curl_global_setup(), curl_easy_init())) {
		if (!m_handle) {
			throw_ex<system_error>(error_code(CURLE_FAILED_INIT, curl_easy_category())
				, "curl_easy_init");
		}
	}

	~curl_easy_handle() noexcept {
		if (m_handle) {
			curl_easy_cleanup(m_handle);
		}
	}

	curl_easy_handle(const curl_easy_handle&) = delete;
	curl_easy_handle& operator=(const curl_easy_handle&) = delete;

	curl_easy_handle(curl_easy_handle&& other) noexcept
		: m_handle(std::exchange(other.m_handle, nullptr)) {}

	curl_easy_handle& operator=(curl_easy_handle&& other) noexcept {
		if (this != &other) {
			if (m_handle) {
				curl_easy_cleanup(m_handle);
			}
			m_handle = std::exchange(other.m_handle, nullptr);
		}
		return *this;
	}

	[[nodiscard]] CURL* get() const noexcept { return m_handle; }

	template<typename T>
	void setopt(CURLoption option, T value, error_code& ec) {
		CURLcode const res = curl_easy_setopt(m_handle, option, value);
		if (res != CURLE_OK) ec.assign(res, curl_easy_category());
	}

	template<typename T>
	void setopt(CURLoption option, T value) {
		error_code ec;
		setopt(option, value, ec);
		if (ec) throw_ex<system_error>(ec, "curl_easy_setopt");
	}

private:
	CURL* m_handle;
};

// RAII wrapper for CURL multi handle
class curl_multi_handle {
public:
	explicit curl_multi_handle()
		: m_handle(curl_multi_init()) {
		if (!m_handle) {
			throw_ex<system_error>(error_code(CURLM_OUT_OF_MEMORY, curl_multi_category())
				, "curl_multi_init");
		}
	}

	~curl_multi_handle() noexcept {
		if (m_handle) {
			curl_multi_cleanup(m_handle);
		}
	}

	curl_multi_handle(const curl_multi_handle&) = delete;
	curl_multi_handle& operator=(const curl_multi_handle&) = delete;

	curl_multi_handle(curl_multi_handle&& other) noexcept
		: m_handle(std::exchange(other.m_handle, nullptr)) {}

	curl_multi_handle& operator=(curl_multi_handle&& other) noexcept {
		if (this != &other) {
			if (m_handle) {
				curl_multi_cleanup(m_handle);
			}
			m_handle = std::exchange(other.m_handle, nullptr);
		}
		return *this;
	}

	[[nodiscard]] CURLM* get() const noexcept { return m_handle; }

	void setopt(CURLMoption option, long value) {
		CURLMcode const res = curl_multi_setopt(m_handle, option, value);
		if (res != CURLM_OK) {
			throw_ex<system_error>(error_code(res, curl_multi_category())
				, "curl_multi_setopt");
		}
	}

	void add_handle(CURL* easy, error_code& ec) {
		CURLMcode const res = curl_multi_add_handle(m_handle, easy);
		if (res != CURLM_OK) ec.assign(res, curl_multi_category());
	}

	void remove_handle(CURL* easy, error_code& ec) {
		CURLMcode const res = curl_multi_remove_handle(m_handle, easy);
		if (res != CURLM_OK) ec.assign(res, curl_multi_category());
	}

	// releases the multi handle early. Every easy handle must have been
	// removed first
	void close(error_code& ec) {
		if (!m_handle) return;
		CURLMcode const res = curl_multi_cleanup(std::exchange(m_handle, nullptr));
		if (res != CURLM_OK) ec.assign(res, curl_multi_category());
	}

private:
	CURLM* m_handle;
};

} // namespace curlagent::aux

#endif // CURLAGENT_CURL_HANDLE_WRAPPERS_HPP_INCLUDED

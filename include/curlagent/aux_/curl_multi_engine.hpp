/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_CURL_MULTI_ENGINE_HPP_INCLUDED
#define CURLAGENT_CURL_MULTI_ENGINE_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/transfer_engine.hpp"
#include "curlagent/aux_/curl_handle_wrappers.hpp"

#include <unordered_map>
#include <vector>

namespace curlagent::aux {

	// the transfer_engine backed by one libcurl multi handle. The token of a
	// transfer is stored in its easy handle (CURLOPT_PRIVATE), so completion
	// messages can be mapped back without a lookup.
	struct CURLAGENT_EXTRA_EXPORT curl_multi_engine final : transfer_engine
	{
		explicit curl_multi_engine(engine_settings const& settings);
		~curl_multi_engine() override;

		engine_handle add(std::unique_ptr<transfer>& t, error_code& ec) override;
		std::unique_ptr<transfer> remove(engine_handle h, error_code& ec) override;
		void bind_token(engine_handle h, token_t t, error_code& ec) override;
		token_t token_of(engine_handle h, error_code& ec) const override;
		void resume_write(engine_handle h, error_code& ec) override;
		void progress(error_code& ec) override;
		void drain_events(std::function<void(token_t, error_code const&)> const& f) override;
		std::optional<milliseconds> suggested_timeout(error_code& ec) override;
		void wait(std::vector<wait_fd>& extra, milliseconds timeout
			, error_code& ec) override;
		void shutdown(error_code& ec) override;

		std::size_t num_transfers() const { return m_transfers.size(); }

	private:

		curl_multi_handle m_multi;

		// the easy handles currently added to m_multi
		std::unordered_map<CURL*, std::unique_ptr<transfer>> m_transfers;

		// reused by wait()
		std::vector<curl_waitfd> m_wait_fds;
	};
}

#endif

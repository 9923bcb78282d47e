/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_MESSAGE_HPP_INCLUDED
#define CURLAGENT_MESSAGE_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_handle.hpp"
#include "curlagent/transfer.hpp"

#include <memory>
#include <variant>

namespace curlagent::aux {

	// the messages sent from agent handles to the worker
	namespace message {

		struct begin_request { std::unique_ptr<transfer> request; };
		struct cancel { token_t token; };
		struct unpause_write { token_t token; };
		struct close {};
	}

	using agent_message = std::variant<
		message::begin_request
		, message::cancel
		, message::unpause_write
		, message::close>;
}

#endif

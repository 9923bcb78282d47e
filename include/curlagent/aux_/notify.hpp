/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_NOTIFY_HPP_INCLUDED
#define CURLAGENT_NOTIFY_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/error_code.hpp"

#include <memory>
#include <utility>

namespace curlagent::aux {

	// owns both ends of the wake pipe. Shared by the sender and the receiver,
	// so a late notify() never writes into a closed pipe.
	struct notify_pipe
	{
		notify_pipe(int read_fd, int write_fd) noexcept
			: m_read(read_fd), m_write(write_fd) {}
		notify_pipe(notify_pipe const&) = delete;
		notify_pipe& operator=(notify_pipe const&) = delete;
		~notify_pipe();

		int read_fd() const { return m_read; }
		int write_fd() const { return m_write; }

	private:
		int m_read;
		int m_write;
	};

	// the signalling end of a wake notifier. Copies signal the same receiver.
	// Pings are coalesced: any number of notify() calls before the receiver
	// drains wake it up once.
	struct CURLAGENT_EXTRA_EXPORT notify_sender
	{
		notify_sender() = default;
		explicit notify_sender(std::shared_ptr<notify_pipe> p)
			: m_pipe(std::move(p)) {}

		// wakes the receiver. Never blocks
		void notify() const;

	private:
		std::shared_ptr<notify_pipe> m_pipe;
	};

	// the waiting end of a wake notifier. Its descriptor becomes readable
	// after notify() and stays so until drain() is called.
	struct CURLAGENT_EXTRA_EXPORT notify_receiver
	{
		notify_receiver() = default;
		explicit notify_receiver(std::shared_ptr<notify_pipe> p)
			: m_pipe(std::move(p)) {}

		// reads all pending pings. Returns true if there was at least one
		bool drain() const;

		// the descriptor to wait on, or -1 if wake notifications are not
		// supported on this platform
		int native_handle() const { return m_pipe ? m_pipe->read_fd() : -1; }

		bool is_supported() const { return bool(m_pipe); }

	private:
		std::shared_ptr<notify_pipe> m_pipe;
	};

	// creates a connected notifier. Where the platform has no descriptor that
	// can be waited on together with the engine's, both ends are returned
	// unsupported: notify() does nothing and native_handle() is -1.
	CURLAGENT_EXTRA_EXPORT std::pair<notify_sender, notify_receiver>
		create_notify(error_code& ec);
}

#endif

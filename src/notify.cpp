/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlagent/aux_/notify.hpp"

#if CURLAGENT_USE_NOTIFY_PIPE
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace curlagent::aux {

#if CURLAGENT_USE_NOTIFY_PIPE

namespace {

	bool set_flags(int const fd)
	{
		int const fl = ::fcntl(fd, F_GETFL);
		if (fl == -1 || ::fcntl(fd, F_SETFL, fl | O_NONBLOCK) == -1) return false;
		int const fdfl = ::fcntl(fd, F_GETFD);
		return fdfl != -1 && ::fcntl(fd, F_SETFD, fdfl | FD_CLOEXEC) != -1;
	}
}

	notify_pipe::~notify_pipe()
	{
		::close(m_read);
		::close(m_write);
	}

	void notify_sender::notify() const
	{
		if (!m_pipe) return;
		char const c = 1;
		for (;;)
		{
			ssize_t const ret = ::write(m_pipe->write_fd(), &c, 1);
			if (ret >= 0) return;
			if (errno == EINTR) continue;
			// EAGAIN means the pipe is full. The receiver will wake up
			// anyway, which is all a ping is for
			return;
		}
	}

	bool notify_receiver::drain() const
	{
		if (!m_pipe) return false;
		bool ret = false;
		char buf[64];
		for (;;)
		{
			ssize_t const n = ::read(m_pipe->read_fd(), buf, sizeof(buf));
			if (n > 0)
			{
				ret = true;
				continue;
			}
			if (n < 0 && errno == EINTR) continue;
			// EAGAIN, the pipe is empty
			return ret;
		}
	}

	std::pair<notify_sender, notify_receiver> create_notify(error_code& ec)
	{
		int fds[2];
		if (::pipe(fds) != 0)
		{
			ec.assign(errno, system_category());
			return {};
		}
		auto p = std::make_shared<notify_pipe>(fds[0], fds[1]);
		if (!set_flags(fds[0]) || !set_flags(fds[1]))
		{
			ec.assign(errno, system_category());
			return {};
		}
		return {notify_sender(p), notify_receiver(p)};
	}

#else

	notify_pipe::~notify_pipe() = default;

	void notify_sender::notify() const {}

	bool notify_receiver::drain() const { return false; }

	std::pair<notify_sender, notify_receiver> create_notify(error_code&)
	{
		return {};
	}

#endif
}

/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_MESSAGE_QUEUE_HPP_INCLUDED
#define CURLAGENT_MESSAGE_QUEUE_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/assert.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace curlagent::aux {

	template <typename T>
	struct channel_state
	{
		std::mutex mutex;
		std::condition_variable cond;
		std::deque<T> queue;

		// the number of live message_sender objects
		int senders = 1;
		bool receiver_alive = true;
	};

	// the sending end of a channel. Any number of copies may send
	// concurrently. When the last copy is destroyed, the receiver is told
	// that no more messages will arrive.
	template <typename T>
	struct message_sender
	{
		message_sender() = default;
		explicit message_sender(std::shared_ptr<channel_state<T>> s)
			: m_state(std::move(s)) {}

		message_sender(message_sender const& rhs)
			: m_state(rhs.m_state)
		{
			if (!m_state) return;
			std::lock_guard<std::mutex> l(m_state->mutex);
			++m_state->senders;
		}

		message_sender(message_sender&& rhs) noexcept
			: m_state(std::move(rhs.m_state)) {}

		message_sender& operator=(message_sender rhs) noexcept
		{
			std::swap(m_state, rhs.m_state);
			return *this;
		}

		~message_sender()
		{
			if (!m_state) return;
			std::lock_guard<std::mutex> l(m_state->mutex);
			CURLAGENT_ASSERT(m_state->senders > 0);
			if (--m_state->senders == 0)
				m_state->cond.notify_all();
		}

		// returns false if the receiver is gone. The message is dropped in
		// that case
		bool send(T msg)
		{
			if (!m_state) return false;
			{
				std::lock_guard<std::mutex> l(m_state->mutex);
				if (m_state->receiver_alive)
				{
					m_state->queue.push_back(std::move(msg));
					m_state->cond.notify_one();
					return true;
				}
			}
			// msg is destroyed outside of the lock. Its destructor may send
			// on this channel
			return false;
		}

	private:
		std::shared_ptr<channel_state<T>> m_state;
	};

	// the receiving end of a channel. There is exactly one.
	template <typename T>
	struct message_receiver
	{
		message_receiver() = default;
		explicit message_receiver(std::shared_ptr<channel_state<T>> s)
			: m_state(std::move(s)) {}

		message_receiver(message_receiver const&) = delete;
		message_receiver& operator=(message_receiver const&) = delete;
		message_receiver(message_receiver&&) noexcept = default;
		message_receiver& operator=(message_receiver&&) = delete;

		~message_receiver()
		{
			if (!m_state) return;
			std::deque<T> pending;
			{
				std::lock_guard<std::mutex> l(m_state->mutex);
				m_state->receiver_alive = false;
				pending.swap(m_state->queue);
			}
			// the messages are destroyed without holding the lock
		}

		// blocks until a message arrives. Returns an empty optional once the
		// queue is empty and every sender is gone
		std::optional<T> recv()
		{
			std::unique_lock<std::mutex> l(m_state->mutex);
			m_state->cond.wait(l, [this]
				{ return !m_state->queue.empty() || m_state->senders == 0; });
			if (m_state->queue.empty()) return std::nullopt;
			std::optional<T> ret(std::move(m_state->queue.front()));
			m_state->queue.pop_front();
			return ret;
		}

		// returns the next message, or an empty optional if there is none
		// right now
		std::optional<T> try_recv()
		{
			std::lock_guard<std::mutex> l(m_state->mutex);
			if (m_state->queue.empty()) return std::nullopt;
			std::optional<T> ret(std::move(m_state->queue.front()));
			m_state->queue.pop_front();
			return ret;
		}

		// true when every sender is gone
		bool disconnected() const
		{
			std::lock_guard<std::mutex> l(m_state->mutex);
			return m_state->senders == 0;
		}

	private:
		std::shared_ptr<channel_state<T>> m_state;
	};

	template <typename T>
	std::pair<message_sender<T>, message_receiver<T>> make_channel()
	{
		auto s = std::make_shared<channel_state<T>>();
		return {message_sender<T>(s), message_receiver<T>(s)};
	}
}

#endif

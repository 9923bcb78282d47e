/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_TOKEN_TABLE_HPP_INCLUDED
#define CURLAGENT_TOKEN_TABLE_HPP_INCLUDED

#include "curlagent/config.hpp"
#include "curlagent/agent_handle.hpp"
#include "curlagent/assert.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace curlagent::aux {

	// maps small integer tokens to values. Tokens of removed entries are
	// handed out again, most recently freed first, so the table never grows
	// beyond the peak number of simultaneous entries.
	template <typename T>
	struct token_table
	{
		// the token the next call to insert() will return
		token_t next_token() const
		{
			return m_free_slots.empty() ? m_slots.size() : m_free_slots.back();
		}

		token_t insert(T v)
		{
			token_t const ret = next_token();
			if (ret == m_slots.size())
			{
				// make sure we can remove this entry without causing a memory
				// allocation, by triggering the allocation now instead
				m_free_slots.reserve(m_slots.size() + 1);
				m_slots.emplace_back(std::move(v));
			}
			else
			{
				m_free_slots.pop_back();
				CURLAGENT_ASSERT(!m_slots[ret]);
				m_slots[ret].emplace(std::move(v));
			}
			++m_size;
			return ret;
		}

		bool contains(token_t const t) const
		{
			return t < m_slots.size() && m_slots[t].has_value();
		}

		T* get(token_t const t)
		{
			if (!contains(t)) return nullptr;
			return &*m_slots[t];
		}

		T const* get(token_t const t) const
		{
			if (!contains(t)) return nullptr;
			return &*m_slots[t];
		}

		// returns the removed value, or an empty optional if the token was
		// not in the table
		std::optional<T> remove(token_t const t)
		{
			if (!contains(t)) return std::nullopt;
			std::optional<T> ret = std::move(m_slots[t]);
			m_slots[t].reset();
			m_free_slots.push_back(t);
			--m_size;
			return ret;
		}

		std::size_t size() const { return m_size; }
		bool empty() const { return m_size == 0; }

		// the number of slots ever allocated
		std::size_t capacity() const { return m_slots.size(); }

	private:
		std::vector<std::optional<T>> m_slots;
		std::vector<token_t> m_free_slots;
		std::size_t m_size = 0;
	};
}

#endif

/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "curlagent/aux_/token_table.hpp"

#include <memory>
#include <set>
#include <string>

using namespace curlagent;
using namespace curlagent::aux;

CURLAGENT_TEST(token_table_insert)
{
	token_table<std::string> t;
	TEST_CHECK(t.empty());
	TEST_EQUAL(t.next_token(), 0);

	TEST_EQUAL(t.insert("a"), 0);
	TEST_EQUAL(t.insert("b"), 1);
	TEST_EQUAL(t.insert("c"), 2);
	TEST_EQUAL(t.size(), 3);
	TEST_EQUAL(t.capacity(), 3);

	TEST_CHECK(t.contains(1));
	TEST_CHECK(!t.contains(3));
	TEST_CHECK(!t.contains(invalid_token));
	TEST_EQUAL(*t.get(0), "a");
	TEST_EQUAL(*t.get(2), "c");
	TEST_CHECK(t.get(3) == nullptr);
}

CURLAGENT_TEST(token_table_remove)
{
	token_table<std::string> t;
	t.insert("a");
	t.insert("b");

	std::optional<std::string> v = t.remove(0);
	TEST_CHECK(v);
	TEST_EQUAL(*v, "a");
	TEST_EQUAL(t.size(), 1);
	TEST_CHECK(!t.contains(0));
	TEST_CHECK(t.get(0) == nullptr);

	// removing twice does nothing
	TEST_CHECK(!t.remove(0));
	TEST_EQUAL(t.size(), 1);

	// unknown tokens are ignored
	TEST_CHECK(!t.remove(10));
	TEST_CHECK(!t.remove(invalid_token));

	TEST_CHECK(t.remove(1));
	TEST_CHECK(t.empty());
}

CURLAGENT_TEST(token_table_recycle_lifo)
{
	token_table<int> t;
	for (int i = 0; i < 5; ++i) t.insert(i);

	t.remove(1);
	t.remove(3);

	// the most recently freed token comes back first
	TEST_EQUAL(t.next_token(), 3);
	TEST_EQUAL(t.insert(30), 3);
	TEST_EQUAL(t.insert(10), 1);
	TEST_EQUAL(t.insert(5), 5);

	TEST_EQUAL(*t.get(1), 10);
	TEST_EQUAL(*t.get(3), 30);
	TEST_EQUAL(t.size(), 6);
	TEST_EQUAL(t.capacity(), 6);
}

CURLAGENT_TEST(token_table_bounded_growth)
{
	token_table<int> t;
	for (int round = 0; round < 100; ++round)
	{
		token_t const a = t.insert(round);
		token_t const b = t.insert(round);
		TEST_CHECK(a != b);
		t.remove(a);
		t.remove(b);
	}
	TEST_EQUAL(t.capacity(), 2);
	TEST_CHECK(t.empty());
}

CURLAGENT_TEST(token_table_unique_live_tokens)
{
	token_table<int> t;
	std::set<token_t> live;
	for (int i = 0; i < 50; ++i)
	{
		token_t const k = t.insert(i);
		TEST_CHECK(live.insert(k).second);
		if (i % 3 == 0)
		{
			TEST_CHECK(t.remove(k));
			live.erase(k);
		}
	}
	TEST_EQUAL(t.size(), live.size());
	for (token_t const k : live) TEST_CHECK(t.contains(k));
}

CURLAGENT_TEST(token_table_move_only)
{
	token_table<std::unique_ptr<int>> t;
	token_t const k = t.insert(std::make_unique<int>(42));
	TEST_EQUAL(**t.get(k), 42);

	std::optional<std::unique_ptr<int>> v = t.remove(k);
	TEST_CHECK(v && *v);
	TEST_EQUAL(**v, 42);
}

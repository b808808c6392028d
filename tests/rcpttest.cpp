// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>
#include <json/value.h>
#include <mforward/json.hpp>
#include <mforward/rcpt_resolve.hpp>
#include <mforward/rule_table.hpp>
#undef assert
#define assert(x) do { if (!(x)) { printf("%s:%d: %s failed\n", __FILE__, __LINE__, #x); return EXIT_FAILURE; } } while (false)
using namespace mforward;
using sv = std::vector<std::string>;

static rule_table mktable(std::vector<rule_table::entry> &&list)
{
	return rule_table(std::move(list));
}

static bool table_rejects(std::vector<rule_table::entry> &&list)
{
	try {
		rule_table t(std::move(list));
	} catch (const config_error &e) {
		printf("\texpected rejection: %s\n", e.what());
		return true;
	}
	return false;
}

static int t_table_validation()
{
	assert(table_rejects({{"info@x.com", {}}}));
	assert(table_rejects({{"", {"a@y.com"}}}));
	assert(table_rejects({{"a@b@c", {"a@y.com"}}}));
	assert(table_rejects({{"user@", {"a@y.com"}}}));
	assert(table_rejects({{"in fo", {"a@y.com"}}}));
	assert(table_rejects({{"info", {"not-an-address"}}}));
	assert(table_rejects({{"info", {"a@y.com", ""}}}));
	assert(table_rejects({{"Info@X.com", {"a@y.com"}}, {"info@x.com", {"b@y.com"}}}));

	auto t = mktable({{"Info@X.com", {"a@y.com"}}, {"@x.com", {"b@y.com"}},
	              {"info", {"c@y.com"}}, {"@", {"d@y.com"}}});
	assert(t.size() == 4);
	auto dl = t.lookup("info@x.com");
	assert(dl != nullptr && *dl == sv{"a@y.com"});
	assert(t.lookup("Info@X.com") == nullptr);
	assert(t.lookup("nobody@x.com") == nullptr);
	return EXIT_SUCCESS;
}

static int t_json_rules()
{
	Json::Value jv;
	assert(str_to_json(R"({"info@x.com": ["a@y.com", "b@y.com"], "@": ["f@y.com"]})", jv, true));
	auto t = rule_table_from_json(jv);
	assert(t->size() == 2);
	assert(*t->lookup("@") == sv{"f@y.com"});

	assert(!str_to_json(R"({"info": ["a@y.com"], "info": ["b@y.com"]})", jv, true));
	assert(str_to_json(R"({"info": "a@y.com"})", jv, true));
	try {
		rule_table_from_json(jv);
		assert(false);
	} catch (const config_error &) {
	}
	assert(str_to_json(R"({"info": [17]})", jv, true));
	try {
		rule_table_from_json(jv);
		assert(false);
	} catch (const config_error &) {
	}
	return EXIT_SUCCESS;
}

static int t_precedence()
{
	auto t = mktable({{"info@x.com", {"full@y.com"}}, {"@x.com", {"dom@y.com"}},
	              {"info", {"user@y.com"}}, {"@", {"all@y.com"}}});
	auto r = rcpt_resolve({"info@x.com"}, t, false);
	assert(r.rcpt == sv{"full@y.com"});
	r = rcpt_resolve({"other@x.com"}, t, false);
	assert(r.rcpt == sv{"dom@y.com"});
	r = rcpt_resolve({"info@z.com"}, t, false);
	assert(r.rcpt == sv{"user@y.com"});
	r = rcpt_resolve({"other@z.com"}, t, false);
	assert(r.rcpt == sv{"all@y.com"});
	r = rcpt_resolve({"INFO@X.COM"}, t, false);
	assert(r.rcpt == sv{"full@y.com"});
	assert(r.chosen == "INFO@X.COM");
	return EXIT_SUCCESS;
}

static int t_plus()
{
	auto t = mktable({{"user@domain.com", {"dest@y.com"}}});
	auto r = rcpt_resolve({"user+x@domain.com"}, t, true);
	assert(r.rcpt == sv{"dest@y.com"});
	assert(r.chosen == "user+x@domain.com");
	r = rcpt_resolve({"user+x@domain.com"}, t, false);
	assert(!r.matched());
	assert(r.chosen.empty());

	assert(rcpt_lookup_key("A+b+c@D.com", true) == "a@d.com");
	assert(rcpt_lookup_key("a@d+x.com", true) == "a@d+x.com");
	assert(rcpt_lookup_key("a+b", true) == "a+b");
	return EXIT_SUCCESS;
}

static int t_accumulate()
{
	auto t = mktable({{"a@x.com", {"d1@y.com", "d2@y.com"}}, {"@x.com", {"d1@y.com"}}});
	/* no dedup across recipients, first matching recipient is credited */
	auto r = rcpt_resolve({"nomatch@z.com", "b@x.com", "a@x.com"}, t, true);
	assert((r.rcpt == sv{"d1@y.com", "d1@y.com", "d2@y.com"}));
	assert(r.chosen == "b@x.com");
	return EXIT_SUCCESS;
}

static int t_scenarios()
{
	auto t1 = mktable({{"info@x.com", {"a@y.com", "b@y.com"}}});
	auto r = rcpt_resolve({"info@x.com"}, t1, true);
	assert((r.rcpt == sv{"a@y.com", "b@y.com"}));
	assert(r.chosen == "info@x.com");

	auto t2 = mktable({{"@", {"fallback@y.com"}}});
	r = rcpt_resolve({"random@x.com"}, t2, true);
	assert(r.rcpt == sv{"fallback@y.com"});
	assert(r.chosen == "random@x.com");

	r = rcpt_resolve({"nomatch@z.com"}, t1, true);
	assert(r.rcpt.empty() && !r.matched());
	assert(r.chosen.empty());
	return EXIT_SUCCESS;
}

int main()
{
	for (auto f : {t_table_validation, t_json_rules, t_precedence, t_plus,
	     t_accumulate, t_scenarios}) {
		auto ret = f();
		if (ret != EXIT_SUCCESS)
			return ret;
	}
	return EXIT_SUCCESS;
}

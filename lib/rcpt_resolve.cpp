// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <string>
#include <utility>
#include <vector>
#include <mforward/rcpt_resolve.hpp>
#include <mforward/rule_table.hpp>
#include <mforward/util.hpp>

namespace mforward {

/**
 * Produce the string used for rule matching: lowercased, and with a
 * "+extension" removed from the local part if @plus_addressing is on
 * (user+tag@domain -> user@domain).
 */
std::string rcpt_lookup_key(const std::string &addr, bool plus_addressing)
{
	auto key = addr;
	mf_strlower(key);
	if (!plus_addressing)
		return key;
	auto plus = key.find('+');
	if (plus == key.npos)
		return key;
	auto at = key.find('@', plus);
	if (at != key.npos)
		key.erase(plus, at - plus);
	return key;
}

/*
 * Try full address, then "@domain", then the local part, then the
 * catch-all. The first hit wins.
 */
const rule_table::dest_list *rcpt_match(const rule_table &tbl, const std::string &key)
{
	auto dl = tbl.lookup(key);
	if (dl != nullptr)
		return dl;
	auto at = key.rfind('@');
	std::string user = at == key.npos ? key : key.substr(0, at);
	if (at != key.npos) {
		dl = tbl.lookup(key.substr(at));
		if (dl != nullptr)
			return dl;
	}
	if (!user.empty()) {
		dl = tbl.lookup(user);
		if (dl != nullptr)
			return dl;
	}
	return tbl.lookup("@");
}

rcpt_resolution rcpt_resolve(const std::vector<std::string> &orig_rcpt,
    const rule_table &tbl, bool plus_addressing)
{
	rcpt_resolution res;
	bool have_chosen = false;
	for (const auto &orig : orig_rcpt) {
		auto dl = rcpt_match(tbl, rcpt_lookup_key(orig, plus_addressing));
		if (dl == nullptr)
			continue;
		res.rcpt.insert(res.rcpt.end(), dl->cbegin(), dl->cend());
		if (!have_chosen) {
			res.chosen = orig;
			have_chosen = true;
		}
	}
	return res;
}

}

// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string>
#include <vector>
#include <mforward/defs.h>
#include <mforward/rule_table.hpp>

namespace mforward {

struct MF_EXPORT rcpt_resolution {
	std::vector<std::string> rcpt;
	/* first original recipient that matched, as delivered (not normalized) */
	std::string chosen;
	bool matched() const { return !rcpt.empty(); }
};

extern MF_EXPORT std::string rcpt_lookup_key(const std::string &addr, bool plus_addressing);
extern MF_EXPORT const rule_table::dest_list *rcpt_match(const rule_table &, const std::string &key);
extern MF_EXPORT rcpt_resolution rcpt_resolve(const std::vector<std::string> &orig_rcpt, const rule_table &, bool plus_addressing);

}

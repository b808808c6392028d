// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <json/value.h>
#include <mforward/defs.h>

namespace mforward {

/* Malformed forwarding rules */
struct MF_EXPORT config_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

/**
 * Mapping from address pattern to the addresses a message is forwarded
 * to. Pattern keys are one of
 *
 * 	"user@domain"	a full address
 * 	"@domain"	all addresses of a domain
 * 	"user"		a mailbox name on any domain
 * 	"@"		catch-all
 *
 * Keys are stored lowercased. The table is immutable once constructed.
 */
class MF_EXPORT rule_table {
	public:
	using dest_list = std::vector<std::string>;
	using entry = std::pair<std::string, dest_list>;

	rule_table() = default;
	/* Throws config_error on invalid keys, empty lists or duplicates. */
	explicit rule_table(std::vector<entry> &&);

	const dest_list *lookup(const std::string &key) const;
	size_t size() const { return m_map.size(); }
	bool empty() const { return m_map.empty(); }

	static bool valid_pattern(std::string_view);
	static bool valid_destination(std::string_view);

	private:
	std::map<std::string, dest_list, std::less<>> m_map;
};

extern MF_EXPORT std::shared_ptr<const rule_table> rule_table_from_json(const Json::Value &);
extern MF_EXPORT std::shared_ptr<const rule_table> rule_table_load(const char *file, const char *sdlist);

}

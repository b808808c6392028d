// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <json/value.h>
#include <libHX/ctype_helper.h>
#include <libHX/io.h>
#include <mforward/defs.h>
#include <mforward/json.hpp>
#include <mforward/rule_table.hpp>
#include <mforward/util.hpp>

namespace mforward {

static bool has_space(std::string_view s)
{
	for (auto c : s)
		if (HX_isspace(c))
			return true;
	return false;
}

bool rule_table::valid_pattern(std::string_view k)
{
	if (k.empty() || has_space(k))
		return false;
	auto at = k.find('@');
	if (at == k.npos)
		return true; /* local part only */
	if (k.find('@', at + 1) != k.npos)
		return false;
	if (k.size() == 1)
		return true; /* catch-all */
	/* "@domain" or "user@domain"; the domain part must not be empty */
	return at + 1 < k.size();
}

bool rule_table::valid_destination(std::string_view d)
{
	auto at = d.rfind('@');
	return !has_space(d) && at != d.npos && at > 0 && at + 1 < d.size();
}

rule_table::rule_table(std::vector<entry> &&list)
{
	for (auto &&[key, dests] : list) {
		if (!valid_pattern(key))
			throw config_error(fmt::format("forward rule \"{}\": unrecognized pattern", key));
		if (dests.empty())
			throw config_error(fmt::format("forward rule \"{}\": empty destination list", key));
		for (const auto &d : dests)
			if (!valid_destination(d))
				throw config_error(fmt::format("forward rule \"{}\": bad destination \"{}\"", key, d));
		mf_strlower(key);
		if (m_map.find(key) != m_map.end())
			throw config_error(fmt::format("forward rule \"{}\" specified more than once", key));
		m_map.emplace(std::move(key), std::move(dests));
	}
}

const rule_table::dest_list *rule_table::lookup(const std::string &key) const
{
	auto i = m_map.find(key);
	return i != m_map.end() ? &i->second : nullptr;
}

/**
 * Build a table from a JSON object of the form
 * {"info@example.com": ["a@example.net", ...], "@": [...]}.
 */
std::shared_ptr<const rule_table> rule_table_from_json(const Json::Value &jv)
{
	if (!jv.isObject())
		throw config_error("forward mapping must be a JSON object");
	std::vector<rule_table::entry> list;
	for (auto it = jv.begin(); it != jv.end(); ++it) {
		auto key = it.name();
		if (!it->isArray())
			throw config_error(fmt::format("forward rule \"{}\": value is not an array", key));
		rule_table::dest_list dests;
		for (const auto &d : *it) {
			if (!d.isString())
				throw config_error(fmt::format("forward rule \"{}\": destination is not a string", key));
			dests.emplace_back(d.asString());
		}
		list.emplace_back(std::move(key), std::move(dests));
	}
	return std::make_shared<const rule_table>(std::move(list));
}

/**
 * @file:	rule file name; looked up in @sdlist unless it has a slash
 */
std::shared_ptr<const rule_table> rule_table_load(const char *file, const char *sdlist)
{
	std::string path;
	size_t slurp_len = 0;
	std::unique_ptr<char[], stdlib_delete> slurp_data;
	if (sdlist == nullptr || strchr(file, '/') != nullptr) {
		path = file;
		slurp_data.reset(HX_slurp_file(file, &slurp_len));
	} else {
		for (const auto &dir : mf_split(sdlist, ':')) {
			if (dir.empty())
				continue;
			path = dir + "/" + file;
			errno = 0;
			slurp_data.reset(HX_slurp_file(path.c_str(), &slurp_len));
			if (slurp_data != nullptr || errno != ENOENT)
				break;
		}
	}
	if (slurp_data == nullptr)
		throw config_error(fmt::format("{}: {}", path.empty() ? file : path.c_str(),
		      strerror(errno != 0 ? errno : ENOENT)));
	Json::Value jv;
	if (!str_to_json(std::string_view(slurp_data.get(), slurp_len), jv, true))
		throw config_error(fmt::format("{}: not valid JSON or duplicate keys", path));
	auto tbl = rule_table_from_json(jv);
	mlog(LV_INFO, "rule_table: loaded %zu forward rules from %s", tbl->size(), path.c_str());
	return tbl;
}

}

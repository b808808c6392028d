// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <memory>
#include <string>
#include <mforward/config_file.hpp>
#include <mforward/fwd_config.hpp>
#include <mforward/rule_table.hpp>
#include <mforward/util.hpp>

namespace mforward {

const cfg_directive mforward_cfg_defaults[] = {
	{"allow_plus_sign", "true", CFG_BOOL},
	{"email_bucket", ""},
	{"email_key_prefix", ""},
	{"forward_mapping", "forward_mapping.json"},
	{"from_email", ""},
	{"log_file", "-"},
	{"log_level", "4"},
	{"smtp_url", "smtp://localhost:25"},
	{"store_root", "/var/lib/mforward"},
	{"subject_prefix", ""},
	{"to_email", ""},
	CFG_TABLE_END,
};

/**
 * Assemble the forwarding settings. The rule file is searched for in
 * the configuration search path unless it is given with a slash.
 * Throws config_error.
 */
fwd_config fwd_config_from_file(const config_file &cfg)
{
	fwd_config fc;
	fc.from_email       = znul(cfg.get_value("from_email"));
	fc.subject_prefix   = znul(cfg.get_value("subject_prefix"));
	fc.to_email         = znul(cfg.get_value("to_email"));
	fc.email_bucket     = znul(cfg.get_value("email_bucket"));
	fc.email_key_prefix = znul(cfg.get_value("email_key_prefix"));
	fc.allow_plus_sign  = parse_bool(cfg.get_value("allow_plus_sign"));
	auto mapfile = cfg.get_value("forward_mapping");
	if (mapfile == nullptr || *mapfile == '\0')
		throw config_error("forward_mapping is not set");
	fc.rules = rule_table_load(mapfile, config_default_searchpath());
	if (!fc.from_email.empty() && !rule_table::valid_destination(fc.from_email))
		throw config_error("from_email \"" + fc.from_email + "\" is not an address");
	return fc;
}

}

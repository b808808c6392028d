// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <memory>
#include <string>
#include <mforward/config_file.hpp>
#include <mforward/defs.h>
#include <mforward/rule_table.hpp>

namespace mforward {

/**
 * Settings for one forwarding run. Empty strings mean "not configured".
 *
 * @from_email:		verified address that replaces the From: address
 * @subject_prefix:	prepended to every Subject: value
 * @to_email:		fixed value for every To: header
 * @email_bucket:	store bucket that holds inbound messages
 * @email_key_prefix:	key prefix of inbound messages, incl. trailing slash
 * @allow_plus_sign:	strip "+ext" from the local part before matching
 */
struct MF_EXPORT fwd_config {
	std::string from_email, subject_prefix, to_email;
	std::string email_bucket, email_key_prefix;
	bool allow_plus_sign = true;
	std::shared_ptr<const rule_table> rules;
};

extern MF_EXPORT const cfg_directive mforward_cfg_defaults[];
extern MF_EXPORT fwd_config fwd_config_from_file(const config_file &);

}

// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string>
#include <vector>
#include <json/value.h>
#include <mforward/defs.h>

namespace mforward {

/* An inbound message as announced by the receiving service */
struct MF_EXPORT inbound_message {
	std::string id;
	std::vector<std::string> rcpt; /* in delivery order */
};

extern MF_EXPORT errno_t event_parse(const Json::Value &, inbound_message &);

}

// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <cerrno>
#include <string>
#include <utility>
#include <json/value.h>
#include <mforward/event.hpp>

namespace mforward {

/**
 * Accepts exactly one receipt record of the form
 *
 * {"Records": [{"eventSource": "aws:ses", "eventVersion": "1.0",
 *   "ses": {"mail": {"messageId": "..."},
 *           "receipt": {"recipients": ["...", ...]}}}]}
 *
 * Returns EINVAL for anything else.
 */
errno_t event_parse(const Json::Value &ev, inbound_message &msg)
{
	if (!ev.isObject() || !ev.isMember("Records"))
		return EINVAL;
	const auto &recs = ev["Records"];
	if (!recs.isArray() || recs.size() != 1)
		return EINVAL;
	const auto &rec = recs[Json::ArrayIndex(0)];
	if (!rec.isObject() ||
	    !rec["eventSource"].isString() || rec["eventSource"].asString() != "aws:ses" ||
	    !rec["eventVersion"].isString() || rec["eventVersion"].asString() != "1.0")
		return EINVAL;
	const auto &ses = rec["ses"];
	if (!ses.isObject())
		return EINVAL;
	const auto &mail = ses["mail"];
	if (!mail.isObject() || !mail["messageId"].isString() ||
	    mail["messageId"].asString().empty())
		return EINVAL;
	const auto &receipt = ses["receipt"];
	if (!receipt.isObject())
		return EINVAL;
	const auto &rcpts = receipt["recipients"];
	if (!rcpts.isArray() || rcpts.size() == 0)
		return EINVAL;
	inbound_message out;
	out.id = mail["messageId"].asString();
	for (const auto &r : rcpts) {
		if (!r.isString())
			return EINVAL;
		out.rcpt.emplace_back(r.asString());
	}
	msg = std::move(out);
	return 0;
}

}

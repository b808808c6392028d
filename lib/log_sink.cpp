// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <algorithm>
#include <climits>
#include <string_view>
#include <mforward/log_sink.hpp>
#include <mforward/util.hpp>

namespace mforward {

void mlog_sink::log(unsigned int level, std::string_view msg,
    std::string_view error) noexcept
{
	auto ml = static_cast<int>(std::min(msg.size(), static_cast<size_t>(INT_MAX)));
	if (error.empty()) {
		mlog(level, "%.*s", ml, msg.data());
		return;
	}
	auto el = static_cast<int>(std::min(error.size(), static_cast<size_t>(INT_MAX)));
	mlog(level, "%.*s (%.*s)", ml, msg.data(), el, error.data());
}

}

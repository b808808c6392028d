// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string_view>
#include <mforward/defs.h>

namespace mforward {

/* Receiver of structured log events from the forwarding pipeline. */
class MF_EXPORT log_sink {
	public:
	virtual ~log_sink() = default;
	/* @error may be empty */
	virtual void log(unsigned int level, std::string_view msg, std::string_view error) noexcept = 0;
};

/* Hands everything to mlog(). */
class MF_EXPORT mlog_sink final : public log_sink {
	public:
	void log(unsigned int level, std::string_view msg, std::string_view error) noexcept override;
};

}

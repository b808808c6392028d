// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string>
#include <string_view>
#include <mforward/defs.h>
#include <mforward/fwd_config.hpp>

namespace mforward {

class log_sink;

extern MF_EXPORT void hdr_split(std::string_view raw, std::string_view &head, std::string_view &body);
extern MF_EXPORT std::string hdr_rewrite(std::string_view raw, const fwd_config &, const std::string &chosen_rcpt, log_sink * = nullptr);

}

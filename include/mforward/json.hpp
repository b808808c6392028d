// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string>
#include <string_view>
#include <json/value.h>
#include <mforward/defs.h>
namespace mforward {
extern MF_EXPORT bool str_to_json(std::string_view, Json::Value &, bool strict = false);
extern MF_EXPORT std::string json_to_str(const Json::Value &);
}

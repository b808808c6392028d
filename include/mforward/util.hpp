// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <mforward/defs.h>

namespace mforward {

extern MF_EXPORT bool parse_bool(const char *s);
extern MF_EXPORT std::vector<std::string> mf_split(std::string_view, char sep);
extern MF_EXPORT std::string mf_join(const std::vector<std::string> &, const char *sep);
extern MF_EXPORT std::string &mf_strlower(std::string &);
extern MF_EXPORT void mlog_init(const char *ident, const char *file, unsigned int level);
extern MF_EXPORT void mlog(unsigned int level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

}

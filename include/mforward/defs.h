// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <string>
#define MF_EXPORT __attribute__((visibility("default")))
#define NOMOVE(K) \
	K(K &&) noexcept = delete; \
	void operator=(K &&) noexcept = delete;

enum mf_loglevel {
	LV_CRIT = 1,
	LV_ERR = 2,
	LV_WARN = 3,
	LV_NOTICE = 4,
	LV_INFO = 5,
	LV_DEBUG = 6,
};

namespace mforward {

using errno_t = int;

struct stdlib_delete {
	inline void operator()(void *x) const { free(x); }
};

struct file_deleter {
	inline void operator()(FILE *f) const { fclose(f); }
};

static inline const char *znul(const char *s) { return s != nullptr ? s : ""; }

}

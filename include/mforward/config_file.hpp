// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <mforward/defs.h>
#define CFG_TABLE_END {}

enum cfg_flags {
	CFG_BOOL = 0x1U,
};

/**
 * @deflt:	default value for this key, used when the file does not set it
 */
struct cfg_directive {
	const char *key = nullptr, *deflt = nullptr;
	unsigned int flags = 0;
};

namespace mforward {

struct MF_EXPORT cfg_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

class MF_EXPORT config_file {
	public:
	config_file() = default;
	const char *get_value(const char *key) const __attribute__((nonnull(2)));
	unsigned long long get_ll(const char *key) const __attribute__((nonnull(2)));
	bool set_value(const char *k, const char *v) __attribute__((nonnull(2,3)));
	void apply_directives(const cfg_directive *);

	std::string m_filename;

	private:
	using map_type = std::map<std::string, std::string>;
	map_type m_vars;
};

extern MF_EXPORT std::shared_ptr<config_file> config_file_init(const char *filename, const cfg_directive *);
extern MF_EXPORT std::shared_ptr<config_file> config_file_initd(const char *basename, const char *searchdirs, const cfg_directive *);
extern MF_EXPORT std::shared_ptr<config_file> config_file_prg(const char *priority_location, const char *fallback_location_basename, const cfg_directive *);
extern MF_EXPORT const char *config_default_searchpath();

}

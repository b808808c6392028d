// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
/*
 *	config file parser for "key = value" files. Comments start with
 *	'#' at the beginning of a line.
 */
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <libHX/ctype_helper.h>
#include <libHX/io.h>
#include <libHX/scope.hpp>
#include <libHX/string.h>
#include <mforward/config_file.hpp>
#include <mforward/defs.h>
#include <mforward/util.hpp>
#ifndef PKGSYSCONFDIR
#	define PKGSYSCONFDIR "/etc/mforward"
#endif

namespace mforward {

static bool key_is_valid(const char *key)
{
	if (*key == '\0')
		return false;
	for (; *key != '\0'; ++key)
		if (!HX_isalnum(*key) && *key != '-' && *key != '_')
			return false;
	return true;
}

const char *config_default_searchpath()
{
	const char *ed = getenv("MFORWARD_CONFIG_PATH");
	return ed != nullptr ? ed : PKGSYSCONFDIR;
}

/*
 *	parse the specified line and store the key/value pair. The line
 *	looks like:
 *			key = value
 */
static void config_file_parse_line(config_file &cfg, char *line)
{
	HX_chomp(line);
	HX_strrtrim(line);
	HX_strltrim(line);
	if (*line == '\0' || *line == '#')
		return;
	auto equal_ptr = strchr(line, '=');
	if (equal_ptr == nullptr)
		return;
	*equal_ptr++ = '\0';
	HX_strrtrim(line);
	HX_strltrim(equal_ptr);
	if (*line == '\0')
		return;
	cfg.set_value(line, equal_ptr);
}

/*
 *	init a config file object with the specified filename
 *
 *	@return
 *		the config file object, or nullptr if the file could not be
 *		read (errno is set)
 */
std::shared_ptr<config_file> config_file_init(const char *filename,
    const cfg_directive *key_desc) try
{
	std::unique_ptr<FILE, file_deleter> fin(fopen(filename, "r"));
	if (fin == nullptr)
		return nullptr;
	auto cfg = std::make_shared<config_file>();
	hxmc_t *line = nullptr;
	auto cl_0 = HX::make_scope_exit([&]() { HXmc_free(line); });
	while (HX_getl(&line, fin.get()) != nullptr)
		config_file_parse_line(*cfg, line);
	cfg->m_filename = filename;
	cfg->apply_directives(key_desc);
	return cfg;
} catch (const std::bad_alloc &) {
	errno = ENOMEM;
	return nullptr;
}

/***
 * @fb:		filename (base) - "foo.cfg"
 * @sdlist:	colon-separated path list
 *
 * Attempt to read config file @fb from various paths (@sdlist). If it
 * exists nowhere, an object with just the defaults is returned.
 */
std::shared_ptr<config_file> config_file_initd(const char *fb,
    const char *sdlist, const cfg_directive *key_desc) try
{
	if (sdlist == nullptr || strchr(fb, '/') != nullptr)
		return config_file_init(fb, key_desc);
	errno = 0;
	for (const auto &dir : mf_split(sdlist, ':')) {
		if (dir.size() == 0)
			continue;
		errno = 0;
		auto full = dir + "/" + fb;
		auto cfg = config_file_init(full.c_str(), key_desc);
		if (cfg != nullptr)
			return cfg;
		if (errno != ENOENT) {
			mlog(LV_ERR, "config_file_initd %s: %s",
			        full.c_str(), strerror(errno));
			return nullptr;
		}
	}
	auto cfg = std::make_shared<config_file>();
	cfg->m_filename = fb;
	cfg->apply_directives(key_desc);
	return cfg;
} catch (const std::bad_alloc &) {
	errno = ENOMEM;
	return nullptr;
}

/**
 * Routine intended for programs:
 *
 * Read user-specified config file (@ov) or, if that is unset, try the
 * default file (@fb, located in default searchpaths) in silent mode.
 */
std::shared_ptr<config_file> config_file_prg(const char *ov, const char *fb,
    const cfg_directive *key_desc)
{
	if (ov == nullptr)
		return config_file_initd(fb, config_default_searchpath(), key_desc);
	auto cfg = config_file_init(ov, key_desc);
	if (cfg == nullptr)
		mlog(LV_ERR, "config_file_init %s: %s", ov, strerror(errno));
	return cfg;
}

const char *config_file::get_value(const char *key) const
{
	std::string k = key;
	auto i = m_vars.find(mf_strlower(k));
	return i != m_vars.end() ? i->second.c_str() : nullptr;
}

unsigned long long config_file::get_ll(const char *key) const
{
	auto sv = get_value(key);
	if (sv == nullptr)
		throw cfg_error(std::string("config key \"") + key +
		      "\" has no default and was not set either");
	return strtoull(sv, nullptr, 0);
}

bool config_file::set_value(const char *key, const char *value)
{
	if (!key_is_valid(key))
		return false;
	std::string k = key;
	m_vars[mf_strlower(k)] = value;
	return true;
}

void config_file::apply_directives(const cfg_directive *d)
{
	if (d == nullptr)
		return;
	for (; d->key != nullptr; ++d) {
		auto sv = get_value(d->key);
		if (d->flags & CFG_BOOL)
			set_value(d->key, parse_bool(sv != nullptr ? sv : d->deflt) ? "1" : "0");
		else if (sv == nullptr && d->deflt != nullptr)
			set_value(d->key, d->deflt);
	}
}

}

// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
/*
 * Forward one inbound message, described by a receipt event (JSON), to
 * the destinations from the forwarding rules.
 */
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string_view>
#include <unistd.h>
#include <json/value.h>
#include <libHX/io.h>
#include <libHX/option.h>
#include <mforward/config_file.hpp>
#include <mforward/defs.h>
#include <mforward/fwd_config.hpp>
#include <mforward/json.hpp>
#include <mforward/log_sink.hpp>
#include <mforward/pipeline.hpp>
#include <mforward/rule_table.hpp>
#include <mforward/send.hpp>
#include <mforward/store.hpp>
#include <mforward/util.hpp>

using namespace mforward;

static char *opt_config_file;
static unsigned int opt_dry_run;

static constexpr HXoption g_options_table[] = {
	{nullptr, 'c', HXTYPE_STRING, &opt_config_file, nullptr, nullptr, 0, "Config file to read", "FILE"},
	{"dry-run", 'n', HXTYPE_NONE, &opt_dry_run, nullptr, nullptr, 0, "Do everything except submitting the message"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static bool read_event(const char *file, Json::Value &jv)
{
	size_t slurp_len = 0;
	std::unique_ptr<char[], stdlib_delete> slurp_data(file == nullptr ||
		strcmp(file, "-") == 0 ? HX_slurp_fd(STDIN_FILENO, &slurp_len) :
		HX_slurp_file(file, &slurp_len));
	if (slurp_data == nullptr) {
		fprintf(stderr, "%s: %s\n", file != nullptr ? file : "stdin", strerror(errno));
		return false;
	}
	if (!str_to_json(std::string_view(slurp_data.get(), slurp_len), jv)) {
		fprintf(stderr, "%s: not a JSON document\n", file != nullptr ? file : "stdin");
		return false;
	}
	return true;
}

int main(int argc, const char **argv)
{
	if (HX_getopt(g_options_table, &argc, &argv, HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_FAILURE;
	if (argc > 2) {
		fprintf(stderr, "Usage: mforward [-c config] [--dry-run] [event.json]\n");
		return EXIT_FAILURE;
	}
	auto cfg = config_file_prg(opt_config_file, "mforward.cfg", mforward_cfg_defaults);
	if (cfg == nullptr)
		return EXIT_FAILURE;
	mlog_init("mforward", cfg->get_value("log_file"), cfg->get_ll("log_level"));

	Json::Value event;
	if (!read_event(argc > 1 ? argv[1] : nullptr, event))
		return EXIT_FAILURE;
	try {
		mlog_sink log;
		fs_store store(znul(cfg->get_value("store_root")));
		smtp_transmitter smtp(znul(cfg->get_value("smtp_url")));
		dryrun_transmitter dry;
		pipeline pl(fwd_config_from_file(*cfg), log, store,
			opt_dry_run ? static_cast<transmitter &>(dry) : smtp);
		bool ok = false;
		pl.handle(event, [&](const char *err) {
			if (err != nullptr)
				mlog(LV_ERR, "%s", err);
			ok = err == nullptr;
		});
		return ok ? EXIT_SUCCESS : EXIT_FAILURE;
	} catch (const config_error &e) {
		mlog(LV_ERR, "mforward: %s", e.what());
		return EXIT_FAILURE;
	}
}

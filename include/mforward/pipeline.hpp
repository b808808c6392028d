// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <json/value.h>
#include <mforward/defs.h>
#include <mforward/event.hpp>
#include <mforward/fwd_config.hpp>

namespace mforward {

class blob_store;
class log_sink;
class transmitter;

enum class fwd_error {
	success, invalid_event, fetch_error, send_error, config_error,
	internal_error,
};

enum class pipe_state {
	validate, resolve, fetch, rewrite, send,
	/* terminal */
	done, skipped, failed,
};

/*
 * Outcome of one stage: go on with the next stage, end the run without
 * error (nothing to forward), or end the run with ctx.error.
 */
enum class hook_result {
	xcontinue, stop, proc_error,
};

/* State of one message run. Never shared between runs. */
struct MF_EXPORT pipe_context {
	pipe_context(const fwd_config &c, const Json::Value &e) : cfg(c), event(e) {}
	NOMOVE(pipe_context);

	const fwd_config &cfg;
	const Json::Value &event;
	inbound_message msg;
	std::vector<std::string> resolved_rcpt;
	std::string chosen_rcpt;
	std::optional<std::string> raw_body, new_body;
	fwd_error error = fwd_error::success;
};

struct MF_EXPORT pipe_result {
	pipe_state state = pipe_state::failed;
	fwd_error error = fwd_error::internal_error;
	/* skipped counts as success */
	bool ok() const { return state != pipe_state::failed; }
};

/**
 * Validate -> Resolve -> Fetch -> Rewrite -> Send, for one message per
 * run() call. The object itself is not modified by runs, so one
 * instance may serve concurrent runs if the collaborators allow it.
 */
class MF_EXPORT pipeline {
	public:
	/* Throws config_error if @cfg has no rule table. */
	pipeline(fwd_config cfg, log_sink &, blob_store &, transmitter &);
	NOMOVE(pipeline);

	pipe_result run(const Json::Value &event) const;
	/* Calls @done exactly once: nullptr on success, a generic message otherwise. */
	void handle(const Json::Value &event, const std::function<void(const char *)> &done) const;

	hook_result validate(pipe_context &) const;
	hook_result resolve(pipe_context &) const;
	hook_result fetch(pipe_context &) const;
	hook_result rewrite(pipe_context &) const;
	hook_result send(pipe_context &) const;

	private:
	fwd_config m_cfg;
	log_sink &m_log;
	blob_store &m_store;
	transmitter &m_xmit;
};

extern MF_EXPORT const char *fwd_strerror(fwd_error);
extern MF_EXPORT const char *pipe_state_name(pipe_state);

}

// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <cstring>
#include <functional>
#include <new>
#include <string>
#include <utility>
#include <fmt/core.h>
#include <json/value.h>
#include <mforward/event.hpp>
#include <mforward/hdr_rewrite.hpp>
#include <mforward/json.hpp>
#include <mforward/log_sink.hpp>
#include <mforward/pipeline.hpp>
#include <mforward/rcpt_resolve.hpp>
#include <mforward/rule_table.hpp>
#include <mforward/send.hpp>
#include <mforward/store.hpp>
#include <mforward/util.hpp>

namespace mforward {

namespace {
struct stage {
	pipe_state state;
	hook_result (pipeline::*func)(pipe_context &) const;
};
}

static constexpr stage g_stages[] = {
	{pipe_state::validate, &pipeline::validate},
	{pipe_state::resolve, &pipeline::resolve},
	{pipe_state::fetch, &pipeline::fetch},
	{pipe_state::rewrite, &pipeline::rewrite},
	{pipe_state::send, &pipeline::send},
};

const char *fwd_strerror(fwd_error e)
{
	switch (e) {
	case fwd_error::success: return "success";
	case fwd_error::invalid_event: return "invalid inbound event";
	case fwd_error::fetch_error: return "could not retrieve message";
	case fwd_error::send_error: return "message sending failed";
	case fwd_error::config_error: return "configuration error";
	case fwd_error::internal_error: return "internal error";
	}
	return "unknown error";
}

const char *pipe_state_name(pipe_state s)
{
	switch (s) {
	case pipe_state::validate: return "validate";
	case pipe_state::resolve: return "resolve";
	case pipe_state::fetch: return "fetch";
	case pipe_state::rewrite: return "rewrite";
	case pipe_state::send: return "send";
	case pipe_state::done: return "done";
	case pipe_state::skipped: return "skipped";
	case pipe_state::failed: return "failed";
	}
	return "unknown";
}

pipeline::pipeline(fwd_config cfg, log_sink &log, blob_store &store,
    transmitter &xmit) :
	m_cfg(std::move(cfg)), m_log(log), m_store(store), m_xmit(xmit)
{
	if (m_cfg.rules == nullptr)
		throw config_error("pipeline: no forwarding rules");
}

hook_result pipeline::validate(pipe_context &ctx) const
{
	if (event_parse(ctx.event, ctx.msg) != 0) {
		m_log.log(LV_ERR, "validate: received invalid receipt event: " +
			json_to_str(ctx.event), {});
		ctx.error = fwd_error::invalid_event;
		return hook_result::proc_error;
	}
	return hook_result::xcontinue;
}

hook_result pipeline::resolve(pipe_context &ctx) const
{
	auto res = rcpt_resolve(ctx.msg.rcpt, *ctx.cfg.rules, ctx.cfg.allow_plus_sign);
	if (!res.matched()) {
		m_log.log(LV_INFO, "Finishing process. No new recipients found for "
			"original destinations: " + mf_join(ctx.msg.rcpt, ", "), {});
		return hook_result::stop;
	}
	ctx.resolved_rcpt = std::move(res.rcpt);
	ctx.chosen_rcpt   = std::move(res.chosen);
	return hook_result::xcontinue;
}

hook_result pipeline::fetch(pipe_context &ctx) const
{
	const auto &cfg = ctx.cfg;
	m_log.log(LV_INFO, fmt::format("Fetching email at {}/{}{}",
		cfg.email_bucket, cfg.email_key_prefix, ctx.msg.id), {});
	std::string body;
	auto err = m_store.fetch_body(cfg.email_bucket, cfg.email_key_prefix,
	           ctx.msg.id, body);
	if (err != 0) {
		m_log.log(LV_ERR, "fetch_body() returned error", strerror(err));
		ctx.error = fwd_error::fetch_error;
		return hook_result::proc_error;
	}
	ctx.raw_body = std::move(body);
	return hook_result::xcontinue;
}

hook_result pipeline::rewrite(pipe_context &ctx) const
{
	if (!ctx.raw_body.has_value()) {
		ctx.error = fwd_error::internal_error;
		return hook_result::proc_error;
	}
	ctx.new_body = hdr_rewrite(*ctx.raw_body, ctx.cfg, ctx.chosen_rcpt, &m_log);
	return hook_result::xcontinue;
}

hook_result pipeline::send(pipe_context &ctx) const
{
	if (!ctx.new_body.has_value() || ctx.resolved_rcpt.empty()) {
		ctx.error = fwd_error::internal_error;
		return hook_result::proc_error;
	}
	m_log.log(LV_INFO, "send: Sending email. Original recipients: " +
		mf_join(ctx.msg.rcpt, ", ") + ". Transformed recipients: " +
		mf_join(ctx.resolved_rcpt, ", ") + ".", {});
	auto err = m_xmit.send(ctx.resolved_rcpt, ctx.chosen_rcpt, *ctx.new_body);
	if (err != 0) {
		m_log.log(LV_ERR, "send() returned error", strerror(err));
		ctx.error = fwd_error::send_error;
		return hook_result::proc_error;
	}
	m_log.log(LV_INFO, "send() successful.", {});
	return hook_result::xcontinue;
}

pipe_result pipeline::run(const Json::Value &event) const
{
	pipe_context ctx(m_cfg, event);
	for (const auto &st : g_stages) {
		auto hr = hook_result::proc_error;
		try {
			hr = (this->*st.func)(ctx);
		} catch (const std::bad_alloc &) {
			m_log.log(LV_ERR, pipe_state_name(st.state), "ENOMEM");
			ctx.error = fwd_error::internal_error;
		}
		if (hr == hook_result::xcontinue)
			continue;
		if (hr == hook_result::stop)
			return {pipe_state::skipped, fwd_error::success};
		m_log.log(LV_ERR, fmt::format("Step returned error: {}: {}",
			pipe_state_name(st.state), fwd_strerror(ctx.error)), {});
		return {pipe_state::failed, ctx.error};
	}
	m_log.log(LV_INFO, "Process finished successfully.", {});
	return {pipe_state::done, fwd_error::success};
}

void pipeline::handle(const Json::Value &event,
    const std::function<void(const char *)> &done) const
{
	auto res = run(event);
	done(res.ok() ? nullptr : "Error: Step returned error.");
}

}

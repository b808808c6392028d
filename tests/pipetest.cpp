// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <json/value.h>
#include <mforward/event.hpp>
#include <mforward/fwd_config.hpp>
#include <mforward/json.hpp>
#include <mforward/log_sink.hpp>
#include <mforward/pipeline.hpp>
#include <mforward/rule_table.hpp>
#include <mforward/send.hpp>
#include <mforward/store.hpp>
#undef assert
#define assert(x) do { if (!(x)) { printf("%s:%d: %s failed\n", __FILE__, __LINE__, #x); return EXIT_FAILURE; } } while (false)
using namespace mforward;
using sv = std::vector<std::string>;

namespace {

struct capture_sink final : public log_sink {
	void log(unsigned int level, std::string_view msg, std::string_view err) noexcept override
	{
		printf("\t<%u> %.*s%s%.*s\n", level, static_cast<int>(msg.size()), msg.data(),
			err.empty() ? "" : " / ", static_cast<int>(err.size()), err.data());
		if (level <= LV_ERR)
			++errors;
	}
	unsigned int errors = 0;
};

struct fake_store final : public blob_store {
	errno_t fetch_body(const std::string &b, const std::string &p,
	    const std::string &id, std::string &out) override
	{
		++calls;
		key = b + "/" + p + id;
		if (fail != 0)
			return fail;
		out = content;
		return 0;
	}
	std::string content, key;
	errno_t fail = 0;
	unsigned int calls = 0;
};

struct fake_xmit final : public transmitter {
	errno_t send(const std::vector<std::string> &d, const std::string &s,
	    const std::string &r) override
	{
		++calls;
		dest = d;
		source = s;
		raw = r;
		return fail;
	}
	std::vector<std::string> dest;
	std::string source, raw;
	errno_t fail = 0;
	unsigned int calls = 0;
};

}

static Json::Value make_event(const sv &rcpt, const char *source = "aws:ses",
    const char *version = "1.0")
{
	Json::Value rec;
	rec["eventSource"] = source;
	rec["eventVersion"] = version;
	rec["ses"]["mail"]["messageId"] = "msg0001";
	auto &jr = rec["ses"]["receipt"]["recipients"];
	jr = Json::arrayValue;
	for (const auto &r : rcpt)
		jr.append(r);
	Json::Value ev;
	ev["Records"].append(std::move(rec));
	return ev;
}

static fwd_config make_config()
{
	fwd_config cfg;
	cfg.from_email = "relay@verified.com";
	cfg.subject_prefix = "[FWD] ";
	cfg.email_bucket = "inbound";
	cfg.email_key_prefix = "mail/";
	cfg.rules = std::make_shared<const rule_table>(std::vector<rule_table::entry>{
		{"info@x.com", {"a@y.com", "b@y.com"}},
	});
	return cfg;
}

static int t_event_validation()
{
	inbound_message msg;
	assert(event_parse(make_event({"info@x.com"}), msg) == 0);
	assert(msg.id == "msg0001");
	assert(msg.rcpt == sv{"info@x.com"});
	assert(event_parse(make_event({}), msg) == EINVAL);
	assert(event_parse(make_event({"info@x.com"}, "aws:sns"), msg) == EINVAL);
	assert(event_parse(make_event({"info@x.com"}, "aws:ses", "2.0"), msg) == EINVAL);
	auto ev = make_event({"info@x.com"});
	Json::Value dup = ev["Records"][Json::ArrayIndex(0)];
	ev["Records"].append(dup);
	assert(event_parse(ev, msg) == EINVAL);
	assert(event_parse(Json::Value(), msg) == EINVAL);
	ev = make_event({"info@x.com"});
	ev["Records"][Json::ArrayIndex(0)]["ses"].removeMember("mail");
	assert(event_parse(ev, msg) == EINVAL);
	ev = make_event({"info@x.com"});
	ev["Records"][Json::ArrayIndex(0)]["ses"]["receipt"]["recipients"].append(5);
	assert(event_parse(ev, msg) == EINVAL);
	return EXIT_SUCCESS;
}

static int t_forward()
{
	capture_sink log;
	fake_store store;
	fake_xmit xmit;
	store.content = "From: Jane <jane@x.com>\r\nSubject: Hi\r\nMessage-ID: <1@x>\r\n\r\nBody text";
	pipeline pl(make_config(), log, store, xmit);
	auto res = pl.run(make_event({"Info@x.com"}));
	assert(res.state == pipe_state::done && res.ok());
	assert(res.error == fwd_error::success);
	assert(store.key == "inbound/mail/msg0001");
	assert(xmit.calls == 1);
	assert((xmit.dest == sv{"a@y.com", "b@y.com"}));
	assert(xmit.source == "Info@x.com");
	assert(xmit.raw == "From: Jane <relay@verified.com>\r\nSubject: [FWD] Hi\r\n"
	       "Reply-To: Jane <jane@x.com>\r\n\r\nBody text");
	assert(log.errors == 0);
	return EXIT_SUCCESS;
}

static int t_skip()
{
	capture_sink log;
	fake_store store;
	fake_xmit xmit;
	pipeline pl(make_config(), log, store, xmit);
	auto res = pl.run(make_event({"nomatch@z.com"}));
	assert(res.state == pipe_state::skipped && res.ok());
	assert(store.calls == 0 && xmit.calls == 0);
	const char *cb_err = "unset";
	unsigned int cb_calls = 0;
	pl.handle(make_event({"nomatch@z.com"}), [&](const char *e) { cb_err = e; ++cb_calls; });
	assert(cb_calls == 1 && cb_err == nullptr);
	assert(log.errors == 0);
	return EXIT_SUCCESS;
}

static int t_failures()
{
	capture_sink log;
	fake_store store;
	fake_xmit xmit;
	pipeline pl(make_config(), log, store, xmit);

	auto res = pl.run(make_event({"info@x.com"}, "aws:sqs"));
	assert(res.state == pipe_state::failed && !res.ok());
	assert(res.error == fwd_error::invalid_event);
	assert(store.calls == 0);

	store.fail = ENOENT;
	res = pl.run(make_event({"info@x.com"}));
	assert(res.error == fwd_error::fetch_error);
	assert(store.calls == 1 && xmit.calls == 0);

	store.fail = 0;
	store.content = "From: a@x.com\n\nx";
	xmit.fail = EIO;
	res = pl.run(make_event({"info@x.com"}));
	assert(res.error == fwd_error::send_error);
	assert(xmit.calls == 1);

	const char *cb_err = nullptr;
	unsigned int cb_calls = 0;
	pl.handle(make_event({"info@x.com"}), [&](const char *e) { cb_err = e; ++cb_calls; });
	assert(cb_calls == 1 && cb_err != nullptr);
	assert(strcmp(cb_err, "Error: Step returned error.") == 0);
	assert(log.errors > 0);
	return EXIT_SUCCESS;
}

static int t_stage_order()
{
	capture_sink log;
	fake_store store;
	fake_xmit xmit;
	auto cfg = make_config();
	pipeline pl(cfg, log, store, xmit);
	auto ev = make_event({"info@x.com"});
	pipe_context ctx(cfg, ev);
	assert(pl.rewrite(ctx) == hook_result::proc_error);
	assert(ctx.error == fwd_error::internal_error);
	ctx.error = fwd_error::success;
	assert(pl.send(ctx) == hook_result::proc_error);
	assert(xmit.calls == 0);
	return EXIT_SUCCESS;
}

static int t_no_rules()
{
	capture_sink log;
	fake_store store;
	fake_xmit xmit;
	try {
		pipeline pl(fwd_config{}, log, store, xmit);
		assert(false);
	} catch (const config_error &) {
	}
	return EXIT_SUCCESS;
}

int main()
{
	for (auto f : {t_event_validation, t_forward, t_skip, t_failures,
	     t_stage_order, t_no_rules}) {
		auto ret = f();
		if (ret != EXIT_SUCCESS)
			return ret;
	}
	return EXIT_SUCCESS;
}

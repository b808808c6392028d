// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
/*
 * Header rewriting for resending an inbound message from a verified
 * address. Only the header block is touched; the body (from the blank
 * separator line onwards) is passed through as-is.
 */
#include <algorithm>
#include <cstring>
#include <string>
#include <string_view>
#include <strings.h>
#include <utility>
#include <vector>
#include <libHX/ctype_helper.h>
#include <mforward/fwd_config.hpp>
#include <mforward/hdr_rewrite.hpp>
#include <mforward/log_sink.hpp>

namespace mforward {

namespace {

/* One header field: the first physical line plus its folded continuations */
struct hdr_field {
	std::vector<std::string> lines; /* each with its own line terminator */
};

}

static std::string_view line_eol(std::string_view ln)
{
	if (ln.size() >= 2 && ln[ln.size()-2] == '\r' && ln[ln.size()-1] == '\n')
		return ln.substr(ln.size() - 2);
	if (ln.size() >= 1 && ln[ln.size()-1] == '\n')
		return ln.substr(ln.size() - 1);
	return {};
}

static std::string_view line_content(std::string_view ln)
{
	return ln.substr(0, ln.size() - line_eol(ln).size());
}

/**
 * Split @raw at the first line that consists of nothing but a line
 * terminator. @head receives everything before it, @body the blank
 * line and everything after. Without such a line, the whole input is
 * @head.
 */
void hdr_split(std::string_view raw, std::string_view &head, std::string_view &body)
{
	size_t pos = 0;
	while (pos < raw.size()) {
		auto nl = raw.find('\n', pos);
		if (nl == raw.npos)
			break;
		auto ln = raw.substr(pos, nl + 1 - pos);
		if (line_content(ln).empty()) {
			head = raw.substr(0, pos);
			body = raw.substr(pos);
			return;
		}
		pos = nl + 1;
	}
	head = raw;
	body = {};
}

static std::vector<hdr_field> hdr_parse(std::string_view head)
{
	std::vector<hdr_field> fields;
	size_t pos = 0;
	while (pos < head.size()) {
		auto nl = head.find('\n', pos);
		auto end = nl == head.npos ? head.size() : nl + 1;
		std::string ln(head.substr(pos, end - pos));
		pos = end;
		if ((ln[0] == ' ' || ln[0] == '\t') && !fields.empty())
			fields.back().lines.push_back(std::move(ln));
		else
			fields.push_back(hdr_field{{std::move(ln)}});
	}
	return fields;
}

static bool field_is(const hdr_field &f, const char *name)
{
	auto z = strlen(name);
	const auto &ln = f.lines.front();
	return ln.size() > z && ln[z] == ':' && strncasecmp(ln.c_str(), name, z) == 0;
}

/* Offset of the value in the first line: after "Name:" and one optional blank */
static size_t value_offset(const hdr_field &f)
{
	const auto &ln = f.lines.front();
	auto pos = ln.find(':') + 1;
	if (pos < ln.size() && (ln[pos] == ' ' || ln[pos] == '\t'))
		++pos;
	return pos;
}

/* The field value exactly as it appears, continuation lines included */
static std::string value_verbatim(const hdr_field &f)
{
	std::string v = f.lines.front().substr(value_offset(f));
	for (size_t i = 1; i < f.lines.size(); ++i)
		v += f.lines[i];
	return v;
}

/* The field value on a single line, with folding line breaks removed */
static std::string value_unfolded(const hdr_field &f)
{
	std::string v(line_content(f.lines.front()).substr(value_offset(f)));
	for (size_t i = 1; i < f.lines.size(); ++i)
		v += line_content(f.lines[i]);
	return v;
}

static std::string_view field_eol(const hdr_field &f)
{
	return line_eol(f.lines.back());
}

static std::string trim(std::string_view s)
{
	while (!s.empty() && HX_isspace(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && HX_isspace(s.back()))
		s.remove_suffix(1);
	return std::string(s);
}

static void add_reply_to(std::vector<hdr_field> &fields, std::string_view eol,
    log_sink *log)
{
	if (std::any_of(fields.cbegin(), fields.cend(),
	    [](const hdr_field &f) { return field_is(f, "reply-to"); }))
		return;
	auto from = std::find_if(fields.cbegin(), fields.cend(),
	            [](const hdr_field &f) { return field_is(f, "from"); });
	auto value = from != fields.cend() ? value_verbatim(*from) : std::string();
	if (trim(value).empty()) {
		if (log != nullptr)
			log->log(LV_INFO, "Reply-To address not added because From "
				"address was not properly extracted.", {});
		return;
	}
	if (line_eol(value).empty())
		value += eol;
	auto &last = fields.back().lines.back();
	if (line_eol(last).empty())
		last += eol;
	if (log != nullptr)
		log->log(LV_INFO, "Added Reply-To address of: " +
			std::string(line_content(value)), {});
	fields.push_back(hdr_field{{"Reply-To: " + std::move(value)}});
}

/*
 * The address part is replaced by the configured sender. Without one,
 * the address goes into the display name ("Jane at jane@x.com") and the
 * original recipient becomes the address.
 */
static void rewrite_from(hdr_field &f, const fwd_config &cfg,
    const std::string &chosen_rcpt)
{
	auto name = value_unfolded(f);
	std::string eol(field_eol(f));
	if (!cfg.from_email.empty()) {
		auto lt = name.find('<');
		auto gt = lt == name.npos ? name.npos : name.rfind('>');
		if (gt != name.npos && gt > lt)
			name.erase(lt, gt - lt + 1);
		name = "From: " + trim(name) + " <" + cfg.from_email + ">" + eol;
	} else {
		auto lt = name.find('<');
		if (lt != name.npos)
			name.replace(lt, 1, "at ");
		auto gt = name.find('>');
		if (gt != name.npos)
			name.erase(gt, 1);
		name = "From: " + name + " <" + chosen_rcpt + ">" + eol;
	}
	f.lines.assign(1, std::move(name));
}

static void prefix_subject(hdr_field &f, const std::string &prefix)
{
	auto &ln = f.lines.front();
	ln = "Subject: " + prefix + ln.substr(value_offset(f));
}

static void replace_to(hdr_field &f, const std::string &to)
{
	f.lines.assign(1, "To: " + to + std::string(field_eol(f)));
}

std::string hdr_rewrite(std::string_view raw, const fwd_config &cfg,
    const std::string &chosen_rcpt, log_sink *log)
{
	std::string_view head, body;
	hdr_split(raw, head, body);
	auto fields = hdr_parse(head);
	std::string eol = "\r\n";
	if (!fields.empty() && !line_eol(fields.front().lines.front()).empty())
		eol = line_eol(fields.front().lines.front());

	add_reply_to(fields, eol, log);
	for (auto &f : fields) {
		if (field_is(f, "from"))
			rewrite_from(f, cfg, chosen_rcpt);
		else if (field_is(f, "subject") && !cfg.subject_prefix.empty())
			prefix_subject(f, cfg.subject_prefix);
		else if (field_is(f, "to") && !cfg.to_email.empty())
			replace_to(f, cfg.to_email);
	}
	/* Headers that the relay sets itself or that no longer verify */
	fields.erase(std::remove_if(fields.begin(), fields.end(), [](const hdr_field &f) {
		return field_is(f, "return-path") || field_is(f, "sender") ||
		       field_is(f, "message-id") || field_is(f, "dkim-signature");
	}), fields.end());

	std::string out;
	out.reserve(raw.size() + 128);
	for (const auto &f : fields)
		for (const auto &ln : f.lines)
			out += ln;
	out += body;
	return out;
}

}

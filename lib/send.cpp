// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <cerrno>
#include <cstring>
#include <new>
#include <string>
#include <vector>
#include <vmime/exception.hpp>
#include <vmime/mailbox.hpp>
#include <vmime/mailboxList.hpp>
#include <vmime/net/service.hpp>
#include <vmime/net/session.hpp>
#include <vmime/net/transport.hpp>
#include <vmime/security/cert/certificateVerifier.hpp>
#include <vmime/utility/inputStreamStringAdapter.hpp>
#include <vmime/utility/url.hpp>
#include <mforward/send.hpp>
#include <mforward/util.hpp>
#if defined(VMIME_HAVE_TLS_SUPPORT) && VMIME_HAVE_TLS_SUPPORT
#	define WITH_TLS 1
#else
#	define WITH_TLS 0
#endif

namespace mforward {

static vmime::shared_ptr<vmime::net::transport> make_transport(const char *url)
{
	bool uv  = strncmp(url, "smtp+unverifiedtls:", 19) == 0;
	bool tls = uv || strncmp(url, "smtp+tls:", 9) == 0;
	vmime::utility::url vurl(url);
	if (tls) {
#if WITH_TLS
		vurl.setProtocol("smtp");
#else
		mlog(LV_ERR, "Unable to create vmime transport for \"%s\": "
			"vmime was built without TLS", url);
		return nullptr;
#endif
	}
	auto xp = vmime::net::session::create()->getTransport(std::move(vurl));
	if (!tls)
		return xp;
#if WITH_TLS
	xp->setProperty("connection.tls", true);
	if (!uv)
		return xp;

	struct uv_impl : public vmime::security::cert::certificateVerifier {
		void verify(const vmime::shared_ptr<vmime::security::cert::certificateChain> &chain, const std::string &host) {}
	};
	xp->setCertificateVerifier(vmime::make_shared<uv_impl>());
	return xp;
#else
	return nullptr;
#endif
}

errno_t smtp_transmitter::send(const std::vector<std::string> &rcpt_list,
    const std::string &sender, const std::string &content) try
{
	if (sender.empty()) {
		mlog(LV_ERR, "smtp_send: empty envelope-from");
		return EINVAL;
	} else if (rcpt_list.size() == 0) {
		mlog(LV_ERR, "smtp_send: empty envelope-rcpt");
		return EINVAL;
	} else if (m_url.empty()) {
		mlog(LV_ERR, "smtp_send: no SMTP target given");
		return EINVAL;
	}
	vmime::mailbox vsender(sender);
	vmime::mailboxList vrcpt_list;
	for (const auto &r : rcpt_list)
		vrcpt_list.appendMailbox(vmime::make_shared<vmime::mailbox>(r));
	vmime::utility::inputStreamStringAdapter ct_adap(content);
	vmime::shared_ptr<vmime::net::transport> xprt;
	try {
		xprt = make_transport(m_url.c_str());
		if (xprt == nullptr)
			return ENOTCONN;
		/* vmime default timeout is 30s */
		xprt->connect();
	} catch (const vmime::exception &e) {
		mlog(LV_ERR, "vmime.connect %s: %s", m_url.c_str(), e.what());
		return ENOTCONN;
	}
	try {
		xprt->send(vsender, vrcpt_list, ct_adap, content.size(), nullptr, {}, {});
		xprt->disconnect();
	} catch (const vmime::exceptions::command_error &e) {
		mlog(LV_ERR, "vmime.send: %s: %s", e.command().c_str(), e.response().c_str());
		return EIO;
	} catch (const vmime::exception &e) {
		mlog(LV_ERR, "vmime.send: %s", e.what());
		return EIO;
	}
	return 0;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "%s: ENOMEM", __func__);
	return ENOMEM;
}

errno_t dryrun_transmitter::send(const std::vector<std::string> &rcpt_list,
    const std::string &sender, const std::string &content)
{
	mlog(LV_NOTICE, "dry-run: would send %zu bytes from <%s> to %s",
		content.size(), sender.c_str(), mf_join(rcpt_list, ", ").c_str());
	return 0;
}

}

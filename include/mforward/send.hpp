// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string>
#include <utility>
#include <vector>
#include <mforward/defs.h>

namespace mforward {

/* Outbound submission of a ready-made RFC 5322 message. */
class MF_EXPORT transmitter {
	public:
	virtual ~transmitter() = default;
	virtual errno_t send(const std::vector<std::string> &dest, const std::string &source, const std::string &raw) = 0;
};

/*
 * Submits via SMTP. @url is smtp://host[:port], smtp+tls://... or
 * smtp+unverifiedtls://... (no certificate check).
 */
class MF_EXPORT smtp_transmitter final : public transmitter {
	public:
	explicit smtp_transmitter(std::string url) : m_url(std::move(url)) {}
	errno_t send(const std::vector<std::string> &, const std::string &, const std::string &) override;

	private:
	std::string m_url;
};

/* Only logs. */
class MF_EXPORT dryrun_transmitter final : public transmitter {
	public:
	errno_t send(const std::vector<std::string> &, const std::string &, const std::string &) override;
};

}

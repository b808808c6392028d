// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#pragma once
#include <string>
#include <utility>
#include <mforward/defs.h>

namespace mforward {

/* Read access to stored inbound messages. */
class MF_EXPORT blob_store {
	public:
	virtual ~blob_store() = default;
	/* Retrieve object @key_prefix+@msg_id in @bucket. Returns 0 or an errno value. */
	virtual errno_t fetch_body(const std::string &bucket, const std::string &key_prefix, const std::string &msg_id, std::string &out) = 0;
};

/*
 * Objects are plain files: bucket B, key K is <root>/B/K. A key prefix
 * with slashes maps onto subdirectories.
 */
class MF_EXPORT fs_store final : public blob_store {
	public:
	explicit fs_store(std::string root) : m_root(std::move(root)) {}
	errno_t fetch_body(const std::string &, const std::string &, const std::string &, std::string &) override;

	private:
	std::string m_root;
};

}

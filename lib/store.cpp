// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <cerrno>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <libHX/io.h>
#include <mforward/defs.h>
#include <mforward/store.hpp>
#include <mforward/util.hpp>

namespace mforward {

static bool unsafe_component(const std::string &s)
{
	return s.empty() || s == "." || s == ".." || s.find('/') != s.npos;
}

errno_t fs_store::fetch_body(const std::string &bucket,
    const std::string &key_prefix, const std::string &msg_id,
    std::string &out) try
{
	if (unsafe_component(bucket) || unsafe_component(msg_id))
		return EINVAL;
	for (const auto &comp : mf_split(key_prefix, '/'))
		if (comp == "..")
			return EINVAL;
	auto path = m_root + "/" + bucket + "/" + key_prefix + msg_id;
	size_t len = 0;
	errno = 0;
	std::unique_ptr<char[], stdlib_delete> data(HX_slurp_file(path.c_str(), &len));
	if (data == nullptr) {
		auto se = errno != 0 ? errno : EIO;
		mlog(LV_DEBUG, "fs_store: %s: %s", path.c_str(), strerror(se));
		return se;
	}
	out.assign(data.get(), len);
	return 0;
} catch (const std::bad_alloc &) {
	return ENOMEM;
}

}

// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of mforward.
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <json/reader.h>
#include <json/writer.h>
#include <mforward/json.hpp>

namespace mforward {

/**
 * @strict:	reject duplicate object keys (and other laxities) instead
 * 		of silently letting the last one win
 */
bool str_to_json(std::string_view sv, Json::Value &jv, bool strict)
{
	Json::CharReaderBuilder crb;
	if (strict) {
		Json::CharReaderBuilder::strictMode(&crb.settings_);
		crb["rejectDupKeys"] = true;
	}
	using reader_t = decltype(crb.newCharReader());
	std::unique_ptr<std::remove_pointer_t<reader_t>> rd(crb.newCharReader());
	return rd->parse(sv.data(), sv.data() + sv.size(), &jv, nullptr);
}

std::string json_to_str(const Json::Value &jv)
{
	Json::StreamWriterBuilder swb;
	swb["indentation"] = "";
	return Json::writeString(swb, jv);
}

}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "File.hxx"

namespace Ini {

const Section *
File::GetSection(std::string_view name) const noexcept
{
	const auto i = sections.find(name);
	if (i == sections.end())
		return nullptr;

	return &i->second;
}

} // namespace Ini

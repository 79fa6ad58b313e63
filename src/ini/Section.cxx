// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Section.hxx"

#include <algorithm>

namespace Ini {

std::string_view
Section::GetValue(std::string_view key) const noexcept
{
	const auto i = std::find_if(entries.begin(), entries.end(),
				    [key](const Entry &entry){
					    return entry.key == key;
				    });
	if (i == entries.end())
		return {};

	return i->value;
}

} // namespace Ini

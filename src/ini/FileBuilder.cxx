// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FileBuilder.hxx"
#include "SectionBuilder.hxx"
#include "Formatter.hxx"
#include "io/Logger.hxx"

namespace Ini {

static const LLogger logger("ini");

void
FileBuilder::Flush(SectionBuilder &&builder)
{
	auto [id, section] = std::move(builder).Finish();

	logger.Fmt(4, "Adding section {} with {} entries",
		   id, section.size());

	if (!id.IsGlobal())
		AddSection(id.GetName(), std::move(section));
	else if (!section.empty())
		SetGlobalSection(std::move(section));
}

} // namespace Ini

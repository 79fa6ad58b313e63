// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Parser.hxx"
#include "LineClassifier.hxx"
#include "SectionBuilder.hxx"
#include "FileBuilder.hxx"
#include "io/Logger.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

namespace Ini {

static const LLogger logger("ini");

File
Parse(std::string_view text)
{
	FileBuilder file_builder;
	SectionBuilder current{SectionId::Global()};

	for (const std::string_view i : IterableSplitString(text, '\n')) {
		const auto line = Strip(i);
		logger(5, "Parsing line: ", line);

		const auto l = ClassifyLine(line);
		switch (l.type) {
		case Line::Type::BLANK:
			break;

		case Line::Type::PROPERTY:
			current.AddEntry(l.GetEntry());
			break;

		case Line::Type::SECTION: {
			const auto name = l.GetSectionName();
			file_builder.Flush(std::move(current));
			current = SectionBuilder{SectionId::Named(name)};
			break;
		}

		case Line::Type::UNPARSABLE:
			logger(1, "Skipping unparsable non-empty line: ", line);
			break;
		}
	}

	file_builder.Flush(std::move(current));
	return std::move(file_builder).Finish();
}

} // namespace Ini

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Find.hxx"
#include "LineClassifier.hxx"
#include "io/Logger.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

namespace Ini {

static const LLogger logger("ini");

std::string_view
Find(std::string_view text, std::string_view key, std::string_view section)
{
	const bool scoped = section.data() != nullptr;

	/* without a section name, the whole file is one big region */
	bool inside = !scoped;

	for (const std::string_view i : IterableSplitString(text, '\n')) {
		const auto line = Strip(i);

		const auto l = ClassifyLine(line);
		switch (l.type) {
		case Line::Type::BLANK:
			break;

		case Line::Type::PROPERTY:
			if (inside) {
				const auto entry = l.GetEntry();
				if (entry.key == key)
					return entry.value;
			}

			break;

		case Line::Type::SECTION:
			if (!scoped)
				break;

			if (inside) {
				/* the target section has ended */
				logger(4, "Key not found in section ", section);
				return {};
			}

			if (l.GetSectionName() == section) {
				logger(5, "Entering section ", section);
				inside = true;
			}

			break;

		case Line::Type::UNPARSABLE:
			logger(1, "Skipping unparsable non-empty line: ", line);
			break;
		}
	}

	return {};
}

} // namespace Ini

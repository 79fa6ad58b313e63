#include "ini/Parser.hxx"
#include "ini/Find.hxx"
#include "ini/Formatter.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

static bool
IsEquivalent(const Ini::Section &a, const Ini::Section &b) noexcept
{
	if (a.size() != b.size())
		return false;

	for (const auto &entry : a)
		if (a.GetValue(entry.key) != b.GetValue(entry.key))
			return false;

	for (const auto &entry : b)
		if (a.GetValue(entry.key) != b.GetValue(entry.key))
			return false;

	return true;
}

static bool
IsEquivalent(const Ini::File &a, const Ini::File &b) noexcept
{
	const auto *ga = a.GetGlobalSection(), *gb = b.GetGlobalSection();
	if ((ga == nullptr) != (gb == nullptr))
		return false;

	if (ga != nullptr && !IsEquivalent(*ga, *gb))
		return false;

	if (a.GetSections().size() != b.GetSections().size())
		return false;

	for (const auto &[name, section] : a.GetSections()) {
		const auto *other = b.GetSection(name);
		if (other == nullptr || !IsEquivalent(section, *other))
			return false;
	}

	return true;
}

extern "C" {
int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);
}

int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
	SetLogLevel(0);

	const std::string_view input{reinterpret_cast<const char *>(data), size};

	const auto file = Ini::Parse(input);

	/* rendering and parsing again must not lose anything */
	const auto rendered = fmt::format("{}", file);
	const auto file2 = Ini::Parse(rendered);
	if (!IsEquivalent(file, file2))
		__builtin_trap();

	(void)Ini::Find(input, "key");
	(void)Ini::Find(input, "key", "section");

	return 0;
}

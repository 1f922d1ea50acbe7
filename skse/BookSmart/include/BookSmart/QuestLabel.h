#pragma once

#include "BookSmart/QuestBookIndex.h"
#include "BookSmart/Records.h"
#include "BookSmart/Settings.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BookSmart
{
	inline constexpr std::string_view kQuestScriptMarker{ "Quest" };

	[[nodiscard]] constexpr std::string_view QuestLabelToken(LabelFormat a_format) noexcept
	{
		return SelectFormatToken(a_format, "Quête", "Q");
	}

	struct QuestLabelResolution
	{
		std::optional<std::string> token;
		bool indexed{ false };
		// Script names that marked the book as quest related. Views into the
		// book record, valid while it is.
		std::vector<std::string_view> matchedScripts;
	};

	// Scripts are only inspected for books the quest index does not know.
	[[nodiscard]] QuestLabelResolution ResolveQuestLabel(
		const BookRecord& a_book,
		const QuestBookIndex& a_index,
		const Settings& a_settings);
}

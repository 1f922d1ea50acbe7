#pragma once

#include "BookSmart/QuestBookIndex.h"
#include "BookSmart/Records.h"
#include "BookSmart/Settings.h"

#include <string>
#include <string_view>
#include <vector>

namespace BookSmart
{
	// Tokens in skill, map marker, quest order.
	using TagSet = std::vector<std::string>;

	struct TagCollection
	{
		TagSet tags;
		std::vector<std::string_view> questScriptMatches;
	};

	[[nodiscard]] TagCollection CollectTags(
		const BookRecord& a_book,
		const Settings& a_settings,
		const QuestBookIndex& a_questBooks);
}

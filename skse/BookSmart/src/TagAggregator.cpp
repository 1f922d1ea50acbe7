#include "BookSmart/TagAggregator.h"

#include "BookSmart/MapMarkerLabel.h"
#include "BookSmart/QuestLabel.h"
#include "BookSmart/SkillLabel.h"

#include <utility>

namespace BookSmart
{
	TagCollection CollectTags(
		const BookRecord& a_book,
		const Settings& a_settings,
		const QuestBookIndex& a_questBooks)
	{
		TagCollection out{};
		out.tags.reserve(3);

		if (a_settings.addSkillLabels) {
			if (auto label = ResolveSkillLabel(a_book, a_settings.labelFormat)) {
				out.tags.push_back(std::move(*label));
			}
		}

		if (a_settings.addMapMarkerLabels) {
			if (auto label = ResolveMapMarkerLabel(a_book, a_settings.labelFormat)) {
				out.tags.push_back(std::move(*label));
			}
		}

		if (a_settings.addQuestLabels) {
			auto quest = ResolveQuestLabel(a_book, a_questBooks, a_settings);
			out.questScriptMatches = std::move(quest.matchedScripts);
			if (quest.token) {
				out.tags.push_back(std::move(*quest.token));
			}
		}

		return out;
	}
}

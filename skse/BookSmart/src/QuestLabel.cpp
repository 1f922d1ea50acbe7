#include "BookSmart/QuestLabel.h"

#include "BookSmart/TextMatch.h"

namespace BookSmart
{
	QuestLabelResolution ResolveQuestLabel(
		const BookRecord& a_book,
		const QuestBookIndex& a_index,
		const Settings& a_settings)
	{
		QuestLabelResolution out{};

		if (a_index.Contains(a_book.id)) {
			out.indexed = true;
		} else {
			// With assumeBookScriptsAreQuests every attached script counts.
			for (const auto& script : a_book.scripts) {
				if (a_settings.assumeBookScriptsAreQuests ||
					detail::ContainsCaseInsensitiveAscii(script, kQuestScriptMarker)) {
					out.matchedScripts.emplace_back(script);
				}
			}
		}

		if (!out.indexed && out.matchedScripts.empty()) {
			return out;
		}

		const auto token = QuestLabelToken(a_settings.labelFormat);
		if (!token.empty()) {
			out.token.emplace(token);
		}
		return out;
	}
}

#include "BookSmart/QuestBookIndex.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace BookSmart
{
	QuestBookIndex QuestBookIndex::Build(const RecordSource& a_source)
	{
		spdlog::info("BookSmart: scanning quest aliases for books, please wait...");

		QuestBookIndex index;
		std::size_t questCount = 0;
		a_source.ForEachQuest([&](const QuestRecord& a_quest) {
			++questCount;
			index.IndexQuest(a_quest, a_source);
		});

		spdlog::info("BookSmart: indexed {} quest book(s) from {} quest(s).", index.Size(), questCount);
		return index;
	}

	void QuestBookIndex::IndexQuest(const QuestRecord& a_quest, const RecordSource& a_source)
	{
		for (const auto& alias : a_quest.aliases) {
			if (alias.createReferenceToObject) {
				IndexReference(*alias.createReferenceToObject, a_source);
			}
			if (alias.items) {
				for (const auto& item : *alias.items) {
					IndexReference(item, a_source);
				}
			}
		}
	}

	void QuestBookIndex::Insert(std::string a_bookId)
	{
		_bookIds.insert(std::move(a_bookId));
	}

	void QuestBookIndex::IndexReference(const std::string& a_reference, const RecordSource& a_source)
	{
		// Aliases point at every kind of object; only books matter here.
		auto bookId = a_source.ResolveBook(a_reference);
		if (!bookId) {
			return;
		}

		spdlog::debug("BookSmart: quest alias references book {}.", *bookId);
		Insert(std::move(*bookId));
	}
}

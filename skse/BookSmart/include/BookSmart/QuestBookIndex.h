#pragma once

#include "BookSmart/RecordSource.h"
#include "BookSmart/Records.h"

#include <cstddef>
#include <string>
#include <unordered_set>

namespace BookSmart
{
	// Set of books referenced by any quest alias, either as the object the
	// alias creates a reference to or as one of the alias inventory items.
	class QuestBookIndex
	{
	public:
		[[nodiscard]] static QuestBookIndex Build(const RecordSource& a_source);

		void IndexQuest(const QuestRecord& a_quest, const RecordSource& a_source);
		void Insert(std::string a_bookId);

		[[nodiscard]] bool Contains(const std::string& a_bookId) const { return _bookIds.contains(a_bookId); }
		[[nodiscard]] std::size_t Size() const noexcept { return _bookIds.size(); }
		[[nodiscard]] bool Empty() const noexcept { return _bookIds.empty(); }

	private:
		void IndexReference(const std::string& a_reference, const RecordSource& a_source);

		std::unordered_set<std::string> _bookIds;
	};
}

#pragma once

#include "BookSmart/Records.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace BookSmart
{
	// Read side of the record database: winning overrides only, in load order.
	class RecordSource
	{
	public:
		using BookVisitor = std::function<void(const BookRecord&)>;
		using QuestVisitor = std::function<void(const QuestRecord&)>;

		virtual ~RecordSource() = default;

		virtual void ForEachBook(const BookVisitor& a_visitor) const = 0;
		virtual void ForEachQuest(const QuestVisitor& a_visitor) const = 0;

		// Identity of the book a reference points at, or nullopt when the
		// reference is dangling or names some other record type.
		[[nodiscard]] virtual std::optional<std::string> ResolveBook(std::string_view a_reference) const = 0;
	};

	class PatchSink
	{
	public:
		virtual ~PatchSink() = default;

		virtual void SetDisplayName(const PatchInstruction& a_instruction) = 0;
	};
}

#pragma once

#include "BookSmart/RecordSource.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

#include <RE/Skyrim.h>

namespace BookSmart
{
	[[nodiscard]] std::string MakeFormKey(const RE::TESForm* a_form);
	[[nodiscard]] RE::TESForm* LookupFormKey(std::string_view a_formKey);

	// Loaded forms seen through the record model. Only the winning version of
	// each form exists at runtime, so the data handler order is the load order.
	class GameRecordSource final : public RecordSource
	{
	public:
		void ForEachBook(const BookVisitor& a_visitor) const override;
		void ForEachQuest(const QuestVisitor& a_visitor) const override;
		[[nodiscard]] std::optional<std::string> ResolveBook(std::string_view a_reference) const override;
	};

	// Renames loaded books in place; the change lives until the game exits.
	class GameBookRenamer final : public PatchSink
	{
	public:
		void SetDisplayName(const PatchInstruction& a_instruction) override;

		[[nodiscard]] std::size_t RenamedCount() const noexcept { return _renamed.size(); }

	private:
		std::unordered_set<RE::FormID> _renamed;
	};
}

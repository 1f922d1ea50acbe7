#pragma once

#include "BookSmart/FormKey.h"
#include "BookSmart/LabelComposer.h"
#include "BookSmart/MapMarkerLabel.h"
#include "BookSmart/PatchDriver.h"
#include "BookSmart/QuestBookIndex.h"
#include "BookSmart/QuestLabel.h"
#include "BookSmart/RecordSource.h"
#include "BookSmart/Records.h"
#include "BookSmart/Settings.h"
#include "BookSmart/SettingsLoader.h"
#include "BookSmart/SkillLabel.h"
#include "BookSmart/TagAggregator.h"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace BookSmartChecks
{
	// Record database stand-in. References resolve to books only when the id
	// belongs to a book listed in `books`.
	class InMemoryRecordSource final : public BookSmart::RecordSource
	{
	public:
		std::vector<BookSmart::BookRecord> books;
		std::vector<BookSmart::QuestRecord> quests;
		mutable std::size_t questScans{ 0 };

		void ForEachBook(const BookVisitor& a_visitor) const override
		{
			for (const auto& book : books) {
				a_visitor(book);
			}
		}

		void ForEachQuest(const QuestVisitor& a_visitor) const override
		{
			++questScans;
			for (const auto& quest : quests) {
				a_visitor(quest);
			}
		}

		[[nodiscard]] std::optional<std::string> ResolveBook(std::string_view a_reference) const override
		{
			for (const auto& book : books) {
				if (book.id == a_reference) {
					return book.id;
				}
			}
			return std::nullopt;
		}
	};

	class RecordingPatchSink final : public BookSmart::PatchSink
	{
	public:
		std::vector<BookSmart::PatchInstruction> written;

		void SetDisplayName(const BookSmart::PatchInstruction& a_instruction) override
		{
			written.push_back(a_instruction);
		}
	};

	[[nodiscard]] inline BookSmart::BookRecord MakeBook(
		std::string a_id,
		std::optional<std::string> a_name,
		std::optional<BookSmart::Skill> a_skill = std::nullopt,
		std::vector<std::string> a_scripts = {})
	{
		return BookSmart::BookRecord{
			.id = std::move(a_id),
			.name = std::move(a_name),
			.teaches = a_skill,
			.scripts = std::move(a_scripts)
		};
	}

	[[nodiscard]] inline BookSmart::Settings OnlySkillLabels()
	{
		BookSmart::Settings settings{};
		settings.addSkillLabels = true;
		settings.addMapMarkerLabels = false;
		settings.addQuestLabels = false;
		return settings;
	}

	bool CheckSkillLabels();
	bool CheckMapMarkerLabels();
	bool CheckLabelComposer();
	bool CheckTagAggregatorOrder();

	bool CheckQuestBookIndex();
	bool CheckQuestLabels();

	bool CheckPatchDriver();
	bool CheckPatchDriverRejectsBadSettings();

	bool CheckSettingsJson();
	bool CheckSettingsFile();
	bool CheckFormKeys();
}

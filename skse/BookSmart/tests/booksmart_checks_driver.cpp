#include "booksmart_checks_common.h"

namespace BookSmartChecks
{
	namespace
	{
		[[nodiscard]] InMemoryRecordSource MakeLibrary()
		{
			using BookSmart::Skill;

			InMemoryRecordSource source{};
			source.books.push_back(MakeBook("Skyrim.esm|0x000001", "Old Tome", Skill::kAlchemy));
			source.books.push_back(MakeBook("Skyrim.esm|0x000002", std::nullopt, Skill::kSmithing, { "MQ01QuestScript" }));
			source.books.push_back(MakeBook("Skyrim.esm|0x000003", "Plain Book"));
			source.books.push_back(MakeBook("Skyrim.esm|0x000004", "Map to Nowhere", std::nullopt, { "DA01MapMarkerScript" }));
			source.books.push_back(MakeBook("Skyrim.esm|0x000005", "Contract"));
			source.books.push_back(MakeBook("Skyrim.esm|0x000006", "Sealed Letter", std::nullopt, { "ReadOnceScript" }));

			BookSmart::QuestRecord quest{};
			quest.id = "Skyrim.esm|0x00F000";
			quest.aliases.push_back({ .createReferenceToObject = std::nullopt, .items = std::vector<std::string>{ "Skyrim.esm|0x000005" } });
			source.quests.push_back(std::move(quest));
			return source;
		}
	}

	bool CheckPatchDriver()
	{
		using BookSmart::EncapsulatingCharacters;
		using BookSmart::LabelFormat;
		using BookSmart::LabelPosition;

		{
			const auto source = MakeLibrary();
			RecordingPatchSink sink{};

			BookSmart::Settings settings{};
			settings.labelFormat = LabelFormat::kLong;
			settings.labelPosition = LabelPosition::kBefore;
			settings.encapsulatingCharacters = EncapsulatingCharacters::kBracket;

			const auto summary = BookSmart::RunPatch(source, sink, settings);
			if (!summary) {
				std::cerr << "driver: expected default run to succeed\n";
				return false;
			}
			if (summary->booksScanned != 6 || summary->booksUnnamed != 1 || summary->booksPatched != 3 ||
				summary->questBooksIndexed != 1) {
				std::cerr << "driver: unexpected summary counts\n";
				return false;
			}
			if (sink.written.size() != 3) {
				std::cerr << "driver: expected three patch instructions\n";
				return false;
			}

			// Load order is preserved and untagged books are left alone.
			const auto& first = sink.written[0];
			const auto& second = sink.written[1];
			const auto& third = sink.written[2];
			if (first.id != "Skyrim.esm|0x000001" || first.originalName != "Old Tome" ||
				first.newName != "[Alchimie] Old Tome") {
				std::cerr << "driver: unexpected skill book patch '" << first.newName << "'\n";
				return false;
			}
			if (second.id != "Skyrim.esm|0x000004" || second.newName != "[Marqueur carte] Map to Nowhere") {
				std::cerr << "driver: unexpected map marker patch '" << second.newName << "'\n";
				return false;
			}
			if (third.id != "Skyrim.esm|0x000005" || third.newName != "[Quête] Contract") {
				std::cerr << "driver: unexpected quest patch '" << third.newName << "'\n";
				return false;
			}
		}

		{
			const auto source = MakeLibrary();
			RecordingPatchSink sink{};
			const auto summary = BookSmart::RunPatch(source, sink, OnlySkillLabels());
			if (!summary || sink.written.size() != 1 || source.questScans != 0) {
				std::cerr << "driver: expected skill-only run without a quest scan\n";
				return false;
			}
			if (summary->questBooksIndexed != 0) {
				std::cerr << "driver: expected empty quest index when quest labels are off\n";
				return false;
			}
		}

		{
			const auto source = MakeLibrary();
			RecordingPatchSink sink{};
			BookSmart::Settings settings{};
			settings.addSkillLabels = false;
			settings.addMapMarkerLabels = false;
			settings.addQuestLabels = false;
			const auto summary = BookSmart::RunPatch(source, sink, settings);
			if (!summary || summary->booksPatched != 0 || !sink.written.empty()) {
				std::cerr << "driver: expected no patches with every label disabled\n";
				return false;
			}
		}

		{
			const auto source = MakeLibrary();
			RecordingPatchSink sink{};
			BookSmart::Settings settings{};
			settings.labelFormat = LabelFormat::kStar;
			settings.labelPosition = LabelPosition::kAfter;
			settings.assumeBookScriptsAreQuests = true;
			const auto summary = BookSmart::RunPatch(source, sink, settings);
			if (!summary || sink.written.size() != 4) {
				std::cerr << "driver: expected star run to also tag the scripted letter\n";
				return false;
			}
			for (const auto& instruction : sink.written) {
				if (instruction.newName != instruction.originalName + "*") {
					std::cerr << "driver: expected single trailing star on '" << instruction.newName << "'\n";
					return false;
				}
			}
		}

		{
			InMemoryRecordSource source{};
			source.books.push_back(MakeBook("Skyrim.esm|0x000010", "Bare Book"));
			RecordingPatchSink sink{};
			BookSmart::Settings settings{};
			settings.addQuestLabels = true;
			settings.assumeBookScriptsAreQuests = false;
			const auto summary = BookSmart::RunPatch(source, sink, settings);
			if (!summary || !sink.written.empty()) {
				std::cerr << "driver: expected bare book to produce no patch\n";
				return false;
			}
		}

		return true;
	}

	bool CheckPatchDriverRejectsBadSettings()
	{
		const auto source = MakeLibrary();

		BookSmart::Settings badFormat{};
		badFormat.labelFormat = static_cast<BookSmart::LabelFormat>(3);
		RecordingPatchSink formatSink{};
		if (BookSmart::RunPatch(source, formatSink, badFormat).has_value() || !formatSink.written.empty()) {
			std::cerr << "driver: expected unsupported label format to abort before writing\n";
			return false;
		}

		BookSmart::Settings badPosition{};
		badPosition.labelPosition = static_cast<BookSmart::LabelPosition>(2);
		RecordingPatchSink positionSink{};
		if (BookSmart::RunPatch(source, positionSink, badPosition).has_value() || !positionSink.written.empty()) {
			std::cerr << "driver: expected unsupported label position to abort before writing\n";
			return false;
		}

		BookSmart::Settings badWrap{};
		badWrap.encapsulatingCharacters = static_cast<BookSmart::EncapsulatingCharacters>(5);
		RecordingPatchSink wrapSink{};
		if (BookSmart::RunPatch(source, wrapSink, badWrap).has_value() || !wrapSink.written.empty()) {
			std::cerr << "driver: expected unsupported encapsulation to abort before writing\n";
			return false;
		}

		return true;
	}
}

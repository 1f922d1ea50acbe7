#include "BookSmart/PatchDriver.h"

#include "BookSmart/LabelComposer.h"
#include "BookSmart/QuestBookIndex.h"
#include "BookSmart/TagAggregator.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace BookSmart
{
	std::optional<PatchSummary> RunPatch(
		const RecordSource& a_source,
		PatchSink& a_sink,
		const Settings& a_settings)
	{
		if (const auto error = ValidateSettings(a_settings)) {
			spdlog::error("BookSmart: refusing to patch books ({}).", DescribeConfigError(*error));
			return std::nullopt;
		}

		PatchSummary summary{};

		// The quest scan is expensive and only feeds quest labels.
		QuestBookIndex questBooks{};
		if (a_settings.addQuestLabels) {
			questBooks = QuestBookIndex::Build(a_source);
			summary.questBooksIndexed = questBooks.Size();
		}

		bool aborted = false;
		a_source.ForEachBook([&](const BookRecord& a_book) {
			if (aborted) {
				return;
			}

			++summary.booksScanned;
			if (!a_book.name) {
				++summary.booksUnnamed;
				return;
			}

			const auto collected = CollectTags(a_book, a_settings, questBooks);
			for (const auto script : collected.questScriptMatches) {
				spdlog::info("BookSmart: {}: '{}' has a quest script named '{}'.", a_book.id, *a_book.name, script);
			}
			if (collected.tags.empty()) {
				return;
			}

			auto newName = ComposeDisplayName(*a_book.name, collected.tags, a_settings);
			if (!newName) {
				spdlog::error("BookSmart: failed to compose a label for {} ('{}').", a_book.id, *a_book.name);
				aborted = true;
				return;
			}

			spdlog::info("BookSmart: {}: '{}' -> '{}'", a_book.id, *a_book.name, *newName);
			a_sink.SetDisplayName(PatchInstruction{
				.id = a_book.id,
				.originalName = *a_book.name,
				.newName = std::move(*newName) });
			++summary.booksPatched;
		});

		if (aborted) {
			return std::nullopt;
		}

		spdlog::info(
			"BookSmart: patched {} of {} book(s) ({} unnamed, {} quest book(s) indexed).",
			summary.booksPatched,
			summary.booksScanned,
			summary.booksUnnamed,
			summary.questBooksIndexed);
		return summary;
	}
}

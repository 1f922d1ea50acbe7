#pragma once

#include "BookSmart/RecordSource.h"
#include "BookSmart/Settings.h"

#include <cstddef>
#include <optional>

namespace BookSmart
{
	struct PatchSummary
	{
		std::size_t booksScanned{ 0 };
		std::size_t booksUnnamed{ 0 };
		std::size_t booksPatched{ 0 };
		std::size_t questBooksIndexed{ 0 };
	};

	// One pass over the winning books. Returns nullopt, without touching the
	// sink, when the settings hold an unsupported enum value.
	[[nodiscard]] std::optional<PatchSummary> RunPatch(
		const RecordSource& a_source,
		PatchSink& a_sink,
		const Settings& a_settings);
}

#pragma once

#include "BookSmart/Records.h"
#include "BookSmart/Settings.h"
#include "BookSmart/TextMatch.h"

#include <optional>
#include <string>
#include <string_view>

namespace BookSmart
{
	inline constexpr std::string_view kMapMarkerScriptMarker{ "MapMarker" };

	[[nodiscard]] constexpr std::string_view MapMarkerLabelToken(LabelFormat a_format) noexcept
	{
		return SelectFormatToken(a_format, "Marqueur carte", "Marqueur");
	}

	// Books that reveal a map marker carry a script with "MapMarker" in its name.
	[[nodiscard]] inline std::optional<std::string> ResolveMapMarkerLabel(const BookRecord& a_book, LabelFormat a_format)
	{
		if (a_book.scripts.empty()) {
			return std::nullopt;
		}
		if (!detail::AnyContainsCaseInsensitiveAscii(a_book.scripts, kMapMarkerScriptMarker)) {
			return std::nullopt;
		}

		const auto token = MapMarkerLabelToken(a_format);
		if (token.empty()) {
			return std::nullopt;
		}
		return std::string{ token };
	}
}

#pragma once

#include "BookSmart/Settings.h"
#include "BookSmart/TagAggregator.h"

#include <optional>
#include <string>
#include <string_view>

namespace BookSmart
{
	inline constexpr std::string_view kLabelSeparator{ "/" };
	inline constexpr std::string_view kStarMarker{ "*" };

	struct Encapsulation
	{
		std::string_view open;
		std::string_view close;
	};

	[[nodiscard]] constexpr std::optional<Encapsulation> SelectEncapsulation(EncapsulatingCharacters a_chars) noexcept
	{
		switch (a_chars) {
		case EncapsulatingCharacters::kAngle:
			return Encapsulation{ "<", ">" };
		case EncapsulatingCharacters::kBrace:
			return Encapsulation{ "{", "}" };
		case EncapsulatingCharacters::kParen:
			return Encapsulation{ "(", ")" };
		case EncapsulatingCharacters::kBracket:
			return Encapsulation{ "[", "]" };
		case EncapsulatingCharacters::kStar:
			return Encapsulation{ "*", "*" };
		}
		return std::nullopt;
	}

	[[nodiscard]] std::string JoinTags(const TagSet& a_tags);

	// "{open}{label}{close} {name}" or "{name} {open}{label}{close}".
	// nullopt when the position or encapsulation is out of range.
	[[nodiscard]] std::optional<std::string> ComposeWrappedLabel(
		std::string_view a_existingName,
		std::string_view a_label,
		LabelPosition a_position,
		EncapsulatingCharacters a_chars);

	// Single '*' glued onto the name, whatever the tags were.
	[[nodiscard]] std::optional<std::string> ComposeStarLabel(std::string_view a_existingName, LabelPosition a_position);

	// Expects a non-empty tag set; the driver never relabels untagged books.
	[[nodiscard]] std::optional<std::string> ComposeDisplayName(
		std::string_view a_existingName,
		const TagSet& a_tags,
		const Settings& a_settings);
}

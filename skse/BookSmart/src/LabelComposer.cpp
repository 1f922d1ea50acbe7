#include "BookSmart/LabelComposer.h"

namespace BookSmart
{
	std::string JoinTags(const TagSet& a_tags)
	{
		std::string joined;
		for (const auto& tag : a_tags) {
			if (!joined.empty()) {
				joined.append(kLabelSeparator);
			}
			joined.append(tag);
		}
		return joined;
	}

	std::optional<std::string> ComposeWrappedLabel(
		std::string_view a_existingName,
		std::string_view a_label,
		LabelPosition a_position,
		EncapsulatingCharacters a_chars)
	{
		const auto wrap = SelectEncapsulation(a_chars);
		if (!wrap) {
			return std::nullopt;
		}

		std::string wrapped;
		wrapped.reserve(wrap->open.size() + a_label.size() + wrap->close.size());
		wrapped.append(wrap->open);
		wrapped.append(a_label);
		wrapped.append(wrap->close);

		std::string out;
		out.reserve(wrapped.size() + 1 + a_existingName.size());
		switch (a_position) {
		case LabelPosition::kBefore:
			out.append(wrapped);
			out.push_back(' ');
			out.append(a_existingName);
			return out;
		case LabelPosition::kAfter:
			out.append(a_existingName);
			out.push_back(' ');
			out.append(wrapped);
			return out;
		}
		return std::nullopt;
	}

	std::optional<std::string> ComposeStarLabel(std::string_view a_existingName, LabelPosition a_position)
	{
		std::string out;
		out.reserve(a_existingName.size() + kStarMarker.size());
		switch (a_position) {
		case LabelPosition::kBefore:
			out.append(kStarMarker);
			out.append(a_existingName);
			return out;
		case LabelPosition::kAfter:
			out.append(a_existingName);
			out.append(kStarMarker);
			return out;
		}
		return std::nullopt;
	}

	std::optional<std::string> ComposeDisplayName(
		std::string_view a_existingName,
		const TagSet& a_tags,
		const Settings& a_settings)
	{
		switch (a_settings.labelFormat) {
		case LabelFormat::kStar:
			return ComposeStarLabel(a_existingName, a_settings.labelPosition);
		case LabelFormat::kLong:
		case LabelFormat::kShort:
			return ComposeWrappedLabel(
				a_existingName,
				JoinTags(a_tags),
				a_settings.labelPosition,
				a_settings.encapsulatingCharacters);
		}
		return std::nullopt;
	}
}

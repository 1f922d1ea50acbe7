#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace BookSmart
{
	enum class LabelFormat : std::uint8_t
	{
		kLong = 0,
		kShort,
		kStar,
	};

	enum class LabelPosition : std::uint8_t
	{
		kBefore = 0,
		kAfter,
	};

	enum class EncapsulatingCharacters : std::uint8_t
	{
		kAngle = 0,
		kBrace,
		kParen,
		kBracket,
		kStar,
	};

	struct Settings
	{
		bool addSkillLabels{ true };
		bool addMapMarkerLabels{ true };
		bool addQuestLabels{ true };
		bool assumeBookScriptsAreQuests{ false };
		LabelFormat labelFormat{ LabelFormat::kLong };
		LabelPosition labelPosition{ LabelPosition::kBefore };
		EncapsulatingCharacters encapsulatingCharacters{ EncapsulatingCharacters::kBracket };
		bool debugLog{ false };
	};

	enum class ConfigError : std::uint8_t
	{
		kUnsupportedLabelFormat = 0,
		kUnsupportedLabelPosition,
		kUnsupportedEncapsulatingCharacters,
	};

	[[nodiscard]] constexpr std::string_view DescribeConfigError(ConfigError a_error) noexcept
	{
		switch (a_error) {
		case ConfigError::kUnsupportedLabelFormat:
			return "unsupported labelFormat";
		case ConfigError::kUnsupportedLabelPosition:
			return "unsupported labelPosition";
		case ConfigError::kUnsupportedEncapsulatingCharacters:
			return "unsupported encapsulatingCharacters";
		}
		return "unknown configuration error";
	}

	// Settings values are read from JSON, so both the English names and the
	// French names written by older BookSmart settings files are accepted.
	[[nodiscard]] constexpr std::optional<LabelFormat> ParseLabelFormat(std::string_view a_text) noexcept
	{
		if (a_text == "Long") {
			return LabelFormat::kLong;
		}
		if (a_text == "Short" || a_text == "Court") {
			return LabelFormat::kShort;
		}
		if (a_text == "Star" || a_text == "Étoile") {
			return LabelFormat::kStar;
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::optional<LabelPosition> ParseLabelPosition(std::string_view a_text) noexcept
	{
		if (a_text == "Before" || a_text == "Avant") {
			return LabelPosition::kBefore;
		}
		if (a_text == "After" || a_text == "Après") {
			return LabelPosition::kAfter;
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::optional<EncapsulatingCharacters> ParseEncapsulatingCharacters(std::string_view a_text) noexcept
	{
		if (a_text == "Angle" || a_text == "Chevrons") {
			return EncapsulatingCharacters::kAngle;
		}
		if (a_text == "Brace" || a_text == "Accolades") {
			return EncapsulatingCharacters::kBrace;
		}
		if (a_text == "Paren" || a_text == "Parenthèses") {
			return EncapsulatingCharacters::kParen;
		}
		if (a_text == "Bracket" || a_text == "Crochets") {
			return EncapsulatingCharacters::kBracket;
		}
		if (a_text == "Star" || a_text == "Étoiles") {
			return EncapsulatingCharacters::kStar;
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr bool IsKnown(LabelFormat a_format) noexcept
	{
		switch (a_format) {
		case LabelFormat::kLong:
		case LabelFormat::kShort:
		case LabelFormat::kStar:
			return true;
		}
		return false;
	}

	[[nodiscard]] constexpr bool IsKnown(LabelPosition a_position) noexcept
	{
		switch (a_position) {
		case LabelPosition::kBefore:
		case LabelPosition::kAfter:
			return true;
		}
		return false;
	}

	[[nodiscard]] constexpr bool IsKnown(EncapsulatingCharacters a_chars) noexcept
	{
		switch (a_chars) {
		case EncapsulatingCharacters::kAngle:
		case EncapsulatingCharacters::kBrace:
		case EncapsulatingCharacters::kParen:
		case EncapsulatingCharacters::kBracket:
		case EncapsulatingCharacters::kStar:
			return true;
		}
		return false;
	}

	// Enum fields can only hold out-of-range values when a caller casts raw
	// integers into them; a run must refuse to start on such settings.
	[[nodiscard]] constexpr std::optional<ConfigError> ValidateSettings(const Settings& a_settings) noexcept
	{
		if (!IsKnown(a_settings.labelFormat)) {
			return ConfigError::kUnsupportedLabelFormat;
		}
		if (!IsKnown(a_settings.labelPosition)) {
			return ConfigError::kUnsupportedLabelPosition;
		}
		// Star labels never use the wrapping characters.
		if (a_settings.labelFormat != LabelFormat::kStar && !IsKnown(a_settings.encapsulatingCharacters)) {
			return ConfigError::kUnsupportedEncapsulatingCharacters;
		}
		return std::nullopt;
	}

	// Picks the token for a fixed-text label. Empty for out-of-range formats.
	[[nodiscard]] constexpr std::string_view SelectFormatToken(
		LabelFormat a_format,
		std::string_view a_long,
		std::string_view a_short) noexcept
	{
		switch (a_format) {
		case LabelFormat::kLong:
			return a_long;
		case LabelFormat::kShort:
			return a_short;
		case LabelFormat::kStar:
			return "*";
		}
		return {};
	}
}

#pragma once

#include <cstddef>
#include <string_view>

namespace BookSmart::detail
{
	[[nodiscard]] constexpr char ToLowerAscii(char a_char) noexcept
	{
		return (a_char >= 'A' && a_char <= 'Z') ? static_cast<char>(a_char + ('a' - 'A')) : a_char;
	}

	// Script names are plain ASCII identifiers; non-ASCII bytes compare exactly.
	[[nodiscard]] constexpr bool ContainsCaseInsensitiveAscii(std::string_view a_text, std::string_view a_pattern) noexcept
	{
		if (a_pattern.empty() || a_text.size() < a_pattern.size()) {
			return false;
		}

		for (std::size_t i = 0; i + a_pattern.size() <= a_text.size(); ++i) {
			bool matched = true;
			for (std::size_t j = 0; j < a_pattern.size(); ++j) {
				if (ToLowerAscii(a_text[i + j]) != ToLowerAscii(a_pattern[j])) {
					matched = false;
					break;
				}
			}
			if (matched) {
				return true;
			}
		}

		return false;
	}

	template <class NameRange>
	[[nodiscard]] constexpr bool AnyContainsCaseInsensitiveAscii(const NameRange& a_names, std::string_view a_pattern) noexcept
	{
		for (const auto& rawName : a_names) {
			if (ContainsCaseInsensitiveAscii(std::string_view{ rawName }, a_pattern)) {
				return true;
			}
		}
		return false;
	}
}

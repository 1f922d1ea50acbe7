#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace BookSmart
{
	// Load-order independent record identity: "Skyrim.esm|0x0A1B2C".
	struct FormKey
	{
		std::string_view plugin;
		std::uint32_t localID{ 0 };
	};

	inline constexpr char kFormKeySeparator = '|';

	[[nodiscard]] inline std::string FormatFormKey(std::string_view a_plugin, std::uint32_t a_localID)
	{
		constexpr char kHex[] = "0123456789ABCDEF";

		std::string out;
		out.reserve(a_plugin.size() + 9);
		out.append(a_plugin);
		out.push_back(kFormKeySeparator);
		out.append("0x");
		for (int shift = 20; shift >= 0; shift -= 4) {
			out.push_back(kHex[(a_localID >> shift) & 0xFu]);
		}
		return out;
	}

	[[nodiscard]] inline std::optional<FormKey> ParseFormKey(std::string_view a_text) noexcept
	{
		const auto pipe = a_text.find(kFormKeySeparator);
		if (pipe == std::string_view::npos || pipe == 0) {
			return std::nullopt;
		}

		const auto plugin = a_text.substr(0, pipe);
		auto idText = a_text.substr(pipe + 1);
		if (idText.starts_with("0x") || idText.starts_with("0X")) {
			idText.remove_prefix(2);
		}
		if (idText.empty()) {
			return std::nullopt;
		}

		std::uint32_t localID = 0;
		const auto result = std::from_chars(idText.data(), idText.data() + idText.size(), localID, 16);
		if (result.ec != std::errc{} || result.ptr != idText.data() + idText.size()) {
			return std::nullopt;
		}
		if (localID > 0x00FFFFFFu) {
			return std::nullopt;
		}

		return FormKey{ plugin, localID };
	}
}

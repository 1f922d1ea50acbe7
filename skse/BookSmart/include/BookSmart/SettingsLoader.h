#pragma once

#include "BookSmart/Settings.h"

#include <filesystem>
#include <optional>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace BookSmart::SettingsLoader
{
	inline constexpr std::string_view kSettingsRelativePath{ "Data/SKSE/Plugins/BookSmart.json" };

	// Overlays the keys present in a_root onto a_outSettings. Unknown enum
	// names are configuration errors; mistyped booleans keep their default.
	[[nodiscard]] std::optional<ConfigError> ApplySettingsJson(const nlohmann::json& a_root, Settings& a_outSettings);

	// Defaults when the file is missing; nullopt when the file is unreadable,
	// not a JSON object, or names an unsupported enum value.
	[[nodiscard]] std::optional<Settings> LoadSettingsFile(const std::filesystem::path& a_path);
}

#include "BookSmart/SettingsLoader.h"

#include <exception>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace BookSmart::SettingsLoader
{
	namespace
	{
		void ReadBool(const nlohmann::json& a_root, const char* a_key, bool& a_out)
		{
			const auto it = a_root.find(a_key);
			if (it == a_root.end()) {
				return;
			}
			if (!it->is_boolean()) {
				spdlog::warn("BookSmart: setting '{}' is not a boolean, keeping {}.", a_key, a_out);
				return;
			}
			a_out = it->get<bool>();
		}

		template <class Enum, class Parser>
		[[nodiscard]] bool ReadEnum(const nlohmann::json& a_root, const char* a_key, Parser a_parse, Enum& a_out)
		{
			const auto it = a_root.find(a_key);
			if (it == a_root.end()) {
				return true;
			}
			if (!it->is_string()) {
				spdlog::error("BookSmart: setting '{}' must be a string.", a_key);
				return false;
			}

			const auto text = it->get<std::string>();
			const auto parsed = a_parse(text);
			if (!parsed) {
				spdlog::error("BookSmart: setting '{}' has unsupported value '{}'.", a_key, text);
				return false;
			}
			a_out = *parsed;
			return true;
		}
	}

	std::optional<ConfigError> ApplySettingsJson(const nlohmann::json& a_root, Settings& a_outSettings)
	{
		ReadBool(a_root, "addSkillLabels", a_outSettings.addSkillLabels);
		ReadBool(a_root, "addMapMarkerLabels", a_outSettings.addMapMarkerLabels);
		ReadBool(a_root, "addQuestLabels", a_outSettings.addQuestLabels);
		ReadBool(a_root, "assumeBookScriptsAreQuests", a_outSettings.assumeBookScriptsAreQuests);
		ReadBool(a_root, "debugLog", a_outSettings.debugLog);

		if (!ReadEnum(a_root, "labelFormat", ParseLabelFormat, a_outSettings.labelFormat)) {
			return ConfigError::kUnsupportedLabelFormat;
		}
		if (!ReadEnum(a_root, "labelPosition", ParseLabelPosition, a_outSettings.labelPosition)) {
			return ConfigError::kUnsupportedLabelPosition;
		}
		if (!ReadEnum(a_root, "encapsulatingCharacters", ParseEncapsulatingCharacters, a_outSettings.encapsulatingCharacters)) {
			return ConfigError::kUnsupportedEncapsulatingCharacters;
		}
		return std::nullopt;
	}

	std::optional<Settings> LoadSettingsFile(const std::filesystem::path& a_path)
	{
		Settings settings{};

		std::error_code ec;
		const bool exists = std::filesystem::exists(a_path, ec);
		if (ec) {
			spdlog::error("BookSmart: failed to inspect settings file {} ({}).", a_path.string(), ec.message());
			return std::nullopt;
		}
		if (!exists) {
			spdlog::warn("BookSmart: settings file not found, using defaults: {}", a_path.string());
			return settings;
		}

		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::error("BookSmart: failed to open settings file {}.", a_path.string());
			return std::nullopt;
		}

		nlohmann::json root;
		try {
			in >> root;
		} catch (const std::exception& e) {
			spdlog::error("BookSmart: failed to parse settings file {} ({}).", a_path.string(), e.what());
			return std::nullopt;
		}

		if (!root.is_object()) {
			spdlog::error("BookSmart: settings file {} must contain a JSON object.", a_path.string());
			return std::nullopt;
		}

		if (const auto error = ApplySettingsJson(root, settings)) {
			spdlog::error("BookSmart: invalid settings in {} ({}).", a_path.string(), DescribeConfigError(*error));
			return std::nullopt;
		}

		spdlog::info("BookSmart: loaded settings from {}", a_path.string());
		return settings;
	}
}

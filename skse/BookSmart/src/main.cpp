#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <RE/Skyrim.h>
#include <SKSE/Logger.h>
#include <SKSE/SKSE.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <Windows.h>

#include "BookSmart/GameRecords.h"
#include "BookSmart/PatchDriver.h"
#include "BookSmart/SettingsLoader.h"

using namespace std::literals;

SKSEPluginInfo(
	.Version = REL::Version{ 1, 0, 0, 0 },
	.Name = "BookSmart"sv,
	.Author = ""sv,
	.SupportEmail = ""sv,
	.StructCompatibility = SKSE::StructCompatibility::Independent,
	.RuntimeCompatibility = SKSE::VersionIndependence::AddressLibrary,
	.MinimumSKSEVersion = REL::Version{ 0, 0, 0, 0 }
)

namespace
{
	void SetupLogging()
	{
		const auto logDir = SKSE::log::log_directory();
		if (!logDir) {
			return;
		}

		auto path = *logDir / "BookSmart.log";
		auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);

		auto logger = std::make_shared<spdlog::logger>("", std::move(sink));
		spdlog::set_default_logger(std::move(logger));
		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
		spdlog::set_level(spdlog::level::info);
		spdlog::flush_on(spdlog::level::info);
	}

	std::filesystem::path ResolveSettingsPath()
	{
		std::vector<wchar_t> buffer(0x4000);
		const DWORD len = ::GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
		if (len == 0 || len >= buffer.size()) {
			return std::filesystem::current_path() / std::filesystem::path(BookSmart::SettingsLoader::kSettingsRelativePath);
		}

		std::filesystem::path gameDir(buffer.data());
		gameDir.remove_filename();
		return gameDir / std::filesystem::path(BookSmart::SettingsLoader::kSettingsRelativePath);
	}

	void PrintToConsole(const std::string& a_line)
	{
		if (auto* console = RE::ConsoleLog::GetSingleton()) {
			console->Print(a_line.c_str());
		}
	}

	void PatchBooks()
	{
		const auto settings = BookSmart::SettingsLoader::LoadSettingsFile(ResolveSettingsPath());
		if (!settings) {
			SKSE::log::error("BookSmart: settings rejected, books left untouched.");
			PrintToConsole("BookSmart: settings rejected, see BookSmart.log.");
			return;
		}

		spdlog::set_level(settings->debugLog ? spdlog::level::debug : spdlog::level::info);
		spdlog::flush_on(settings->debugLog ? spdlog::level::debug : spdlog::level::info);

		const BookSmart::GameRecordSource source{};
		BookSmart::GameBookRenamer renamer{};
		const auto summary = BookSmart::RunPatch(source, renamer, *settings);
		if (!summary) {
			PrintToConsole("BookSmart: patch aborted, see BookSmart.log.");
			return;
		}

		PrintToConsole(
			"BookSmart: relabeled " + std::to_string(renamer.RenamedCount()) + " of " +
			std::to_string(summary->booksScanned) + " books.");
	}

	void OnMessage(SKSE::MessagingInterface::Message* a_message)
	{
		if (!a_message) {
			return;
		}

		switch (a_message->type) {
		case SKSE::MessagingInterface::kDataLoaded:
			PatchBooks();
			break;
		default:
			break;
		}
	}
}

SKSEPluginLoad(const SKSE::LoadInterface* a_skse)
{
	SKSE::Init(a_skse);
	SetupLogging();
	SKSE::log::info("BookSmart: plugin loaded, waiting for kDataLoaded.");

	if (auto* messaging = SKSE::GetMessagingInterface()) {
		messaging->RegisterListener(OnMessage);
	}
	return true;
}

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace BookSmart
{
	// Numbered like the engine's actor values so the game adapter can cast directly.
	enum class Skill : std::int32_t
	{
		kNone = -1,

		kOneHanded = 6,
		kTwoHanded = 7,
		kArchery = 8,
		kBlock = 9,
		kSmithing = 10,
		kHeavyArmor = 11,
		kLightArmor = 12,
		kPickpocket = 13,
		kLockpicking = 14,
		kSneak = 15,
		kAlchemy = 16,
		kSpeech = 17,
		kAlteration = 18,
		kConjuration = 19,
		kDestruction = 20,
		kIllusion = 21,
		kRestoration = 22,
		kEnchanting = 23,
	};

	struct BookRecord
	{
		std::string id;
		std::optional<std::string> name;
		std::optional<Skill> teaches;
		std::vector<std::string> scripts;
	};

	// Reference targets are record identities; whether they name a book is only
	// known after resolution against the record database.
	struct QuestAlias
	{
		std::optional<std::string> createReferenceToObject;
		std::optional<std::vector<std::string>> items;
	};

	struct QuestRecord
	{
		std::string id;
		std::vector<QuestAlias> aliases;
	};

	struct PatchInstruction
	{
		std::string id;
		std::string originalName;
		std::string newName;
	};
}

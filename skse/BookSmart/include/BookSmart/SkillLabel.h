#pragma once

#include "BookSmart/Records.h"
#include "BookSmart/Settings.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace BookSmart
{
	struct SkillLabelTokens
	{
		Skill skill{ Skill::kNone };
		std::string_view longName;
		std::string_view shortName;
	};

	inline constexpr std::array<SkillLabelTokens, 18> kSkillLabelTokens{ {
		{ Skill::kOneHanded, "Une main", "1M" },
		{ Skill::kTwoHanded, "Deux mains", "2M" },
		{ Skill::kArchery, "Archerie", "Arch" },
		{ Skill::kBlock, "Parade", "Pard" },
		{ Skill::kSmithing, "Forgeage", "Forge" },
		{ Skill::kHeavyArmor, "Armure lourde", "Arm.L" },
		{ Skill::kLightArmor, "Armure légère", "Arm.l" },
		{ Skill::kPickpocket, "Vol à la tire", "Vol" },
		{ Skill::kLockpicking, "Crochetage", "Croch" },
		{ Skill::kSneak, "Furtivité", "Furti" },
		{ Skill::kAlchemy, "Alchimie", "Alch" },
		{ Skill::kSpeech, "Éloquence", "Éloq" },
		{ Skill::kAlteration, "Altération", "Altr" },
		{ Skill::kConjuration, "Conjuration", "Conj" },
		{ Skill::kDestruction, "Destruction", "Dest" },
		{ Skill::kIllusion, "Illusion", "Illu" },
		{ Skill::kRestoration, "Guérison", "Guéri" },
		{ Skill::kEnchanting, "Enchantement", "Ench" },
	} };

	[[nodiscard]] constexpr const SkillLabelTokens* FindSkillLabelTokens(Skill a_skill) noexcept
	{
		for (const auto& entry : kSkillLabelTokens) {
			if (entry.skill == a_skill) {
				return &entry;
			}
		}
		return nullptr;
	}

	// Label for the skill a book teaches. Unlisted skill values are labelled
	// with their raw actor value id.
	[[nodiscard]] inline std::optional<std::string> ResolveSkillLabel(const BookRecord& a_book, LabelFormat a_format)
	{
		if (!a_book.teaches || *a_book.teaches == Skill::kNone) {
			return std::nullopt;
		}

		const auto skill = *a_book.teaches;
		if (a_format == LabelFormat::kStar) {
			return std::string{ "*" };
		}
		if (a_format != LabelFormat::kLong && a_format != LabelFormat::kShort) {
			return std::nullopt;
		}

		const auto* tokens = FindSkillLabelTokens(skill);
		if (!tokens) {
			return std::to_string(static_cast<std::int32_t>(skill));
		}
		return std::string{ a_format == LabelFormat::kLong ? tokens->longName : tokens->shortName };
	}
}

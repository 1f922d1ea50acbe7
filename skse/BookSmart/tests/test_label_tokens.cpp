#include "BookSmart/LabelComposer.h"
#include "BookSmart/MapMarkerLabel.h"
#include "BookSmart/QuestLabel.h"
#include "BookSmart/SkillLabel.h"

using namespace BookSmart;

static_assert([] {
	const auto* tokens = FindSkillLabelTokens(Skill::kAlchemy);
	return tokens && tokens->longName == "Alchimie" && tokens->shortName == "Alch";
}());

static_assert([] {
	const auto* tokens = FindSkillLabelTokens(Skill::kHeavyArmor);
	return tokens && tokens->shortName == "Arm.L";
}());

static_assert([] {
	const auto* tokens = FindSkillLabelTokens(Skill::kLightArmor);
	return tokens && tokens->shortName == "Arm.l";
}(),
	"FindSkillLabelTokens: light and heavy armor differ only by case");

static_assert(FindSkillLabelTokens(Skill::kNone) == nullptr);
static_assert(FindSkillLabelTokens(static_cast<Skill>(30)) == nullptr);

static_assert([] {
	for (const auto& entry : kSkillLabelTokens) {
		if (entry.longName.empty() || entry.shortName.empty()) {
			return false;
		}
		if (FindSkillLabelTokens(entry.skill) != &entry) {
			return false;
		}
	}
	return true;
}(),
	"kSkillLabelTokens: every skill has one entry with both forms");

static_assert(MapMarkerLabelToken(LabelFormat::kLong) == "Marqueur carte");
static_assert(MapMarkerLabelToken(LabelFormat::kShort) == "Marqueur");
static_assert(MapMarkerLabelToken(LabelFormat::kStar) == "*");

static_assert(QuestLabelToken(LabelFormat::kLong) == "Quête");
static_assert(QuestLabelToken(LabelFormat::kShort) == "Q");
static_assert(QuestLabelToken(LabelFormat::kStar) == "*");

static_assert([] {
	const auto wrap = SelectEncapsulation(EncapsulatingCharacters::kAngle);
	return wrap && wrap->open == "<" && wrap->close == ">";
}());

static_assert([] {
	const auto wrap = SelectEncapsulation(EncapsulatingCharacters::kStar);
	return wrap && wrap->open == "*" && wrap->close == "*";
}());

static_assert(!SelectEncapsulation(static_cast<EncapsulatingCharacters>(12)).has_value());

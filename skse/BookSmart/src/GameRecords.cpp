#include "BookSmart/GameRecords.h"

#include "BookSmart/FormKey.h"

#include <cstdint>
#include <utility>
#include <vector>

#include <SKSE/SKSE.h>

namespace BookSmart
{
	namespace
	{
		[[nodiscard]] std::vector<std::string> CollectAttachedScriptNames(RE::TESForm* a_form)
		{
			std::vector<std::string> names;

			auto* vm = RE::BSScript::Internal::VirtualMachine::GetSingleton();
			if (!vm) {
				return names;
			}
			auto* policy = vm->GetObjectHandlePolicy();
			if (!policy) {
				return names;
			}

			const auto handle = policy->GetHandleForObject(static_cast<RE::VMTypeID>(a_form->GetFormType()), a_form);
			if (handle == policy->EmptyHandle()) {
				return names;
			}

			RE::BSSpinLockGuard locker(vm->attachedScriptsLock);
			const auto it = vm->attachedScripts.find(handle);
			if (it == vm->attachedScripts.end()) {
				return names;
			}

			for (const auto& script : it->second) {
				const auto* typeInfo = script ? script->GetTypeInfo() : nullptr;
				if (typeInfo) {
					names.emplace_back(typeInfo->GetName());
				}
			}
			return names;
		}

		[[nodiscard]] BookRecord MakeBookRecord(RE::TESObjectBOOK* a_book)
		{
			BookRecord record{};
			record.id = MakeFormKey(a_book);

			// The engine has no "no name" state; an empty name is treated as one.
			if (const char* name = a_book->GetFullName(); name && name[0] != '\0') {
				record.name.emplace(name);
			}
			if (a_book->TeachesSkill()) {
				record.teaches = static_cast<Skill>(static_cast<std::int32_t>(a_book->GetSkill()));
			}
			record.scripts = CollectAttachedScriptNames(a_book);
			return record;
		}

		[[nodiscard]] QuestRecord MakeQuestRecord(RE::TESQuest* a_quest)
		{
			QuestRecord record{};
			record.id = MakeFormKey(a_quest);
			record.aliases.reserve(a_quest->aliases.size());

			for (auto* alias : a_quest->aliases) {
				if (!alias) {
					continue;
				}

				QuestAlias out{};
				if (alias->GetVMTypeID() == RE::BGSRefAlias::VMTYPEID) {
					const auto* refAlias = static_cast<const RE::BGSRefAlias*>(alias);
					if (refAlias->fillType == RE::BGSBaseAlias::FILL_TYPE::kCreated) {
						if (const auto* object = refAlias->fillData.created.object) {
							out.createReferenceToObject = MakeFormKey(object);
						}
					}
				}
				record.aliases.push_back(std::move(out));
			}
			return record;
		}
	}

	std::string MakeFormKey(const RE::TESForm* a_form)
	{
		const auto formID = a_form->GetFormID();
		const auto* file = a_form->GetFile(0);
		if (!file) {
			// Runtime-created forms have no plugin; the raw id is still unique.
			return FormatFormKey("", formID & 0x00FFFFFFu);
		}

		const bool light = (formID >> 24) == 0xFEu;
		const std::uint32_t localID = light ? (formID & 0x00000FFFu) : (formID & 0x00FFFFFFu);
		return FormatFormKey(file->GetFilename(), localID);
	}

	RE::TESForm* LookupFormKey(std::string_view a_formKey)
	{
		const auto key = ParseFormKey(a_formKey);
		if (!key) {
			return nullptr;
		}

		auto* handler = RE::TESDataHandler::GetSingleton();
		if (!handler) {
			return nullptr;
		}
		return handler->LookupForm(static_cast<RE::FormID>(key->localID), key->plugin);
	}

	void GameRecordSource::ForEachBook(const BookVisitor& a_visitor) const
	{
		auto* handler = RE::TESDataHandler::GetSingleton();
		if (!handler) {
			SKSE::log::error("BookSmart: TESDataHandler unavailable, no books to scan.");
			return;
		}

		for (auto* book : handler->GetFormArray<RE::TESObjectBOOK>()) {
			if (!book) {
				continue;
			}
			a_visitor(MakeBookRecord(book));
		}
	}

	void GameRecordSource::ForEachQuest(const QuestVisitor& a_visitor) const
	{
		auto* handler = RE::TESDataHandler::GetSingleton();
		if (!handler) {
			SKSE::log::error("BookSmart: TESDataHandler unavailable, no quests to scan.");
			return;
		}

		for (auto* quest : handler->GetFormArray<RE::TESQuest>()) {
			if (!quest || quest->aliases.empty()) {
				continue;
			}
			a_visitor(MakeQuestRecord(quest));
		}
	}

	std::optional<std::string> GameRecordSource::ResolveBook(std::string_view a_reference) const
	{
		auto* form = LookupFormKey(a_reference);
		if (!form || !form->Is(RE::FormType::Book)) {
			return std::nullopt;
		}
		return MakeFormKey(form);
	}

	void GameBookRenamer::SetDisplayName(const PatchInstruction& a_instruction)
	{
		auto* book = LookupFormKey(a_instruction.id);
		auto* bookForm = book ? book->As<RE::TESObjectBOOK>() : nullptr;
		if (!bookForm) {
			SKSE::log::warn("BookSmart: book {} vanished before it could be renamed.", a_instruction.id);
			return;
		}

		if (!_renamed.insert(bookForm->GetFormID()).second) {
			SKSE::log::warn("BookSmart: book {} was already renamed this run, skipping.", a_instruction.id);
			return;
		}

		bookForm->fullName = a_instruction.newName;
	}
}

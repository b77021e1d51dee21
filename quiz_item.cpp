#include "quiz_item.hpp"

#include <algorithm>
#include <initializer_list>

#include "text_util.hpp"

namespace quiz {

using textutil::normalizeText;

namespace {

std::string stringField(const json &j, std::initializer_list<const char *> keys) {
	for (const char *k : keys) {
		if (!j.contains(k)) continue;
		const auto &v = j[k];
		if (v.is_string()) return v.get<std::string>();
		if (v.is_number()) return v.dump();
		if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
	}
	return "";
}

// Accepts ["A", "B"] and [{"id": "a", "text": "A"}, ...]. ids collects the option ids when present.
std::vector<std::string> choicesField(const json &j, std::vector<std::string> &ids) {
	std::vector<std::string> out;
	const json *arr = nullptr;
	if (j.contains("choices") && j["choices"].is_array()) arr = &j["choices"];
	else if (j.contains("options") && j["options"].is_array()) arr = &j["options"];
	if (!arr) return out;
	for (const auto &c : *arr) {
		if (c.is_string()) {
			out.push_back(c.get<std::string>());
			ids.emplace_back();
		} else if (c.is_number()) {
			out.push_back(c.dump());
			ids.emplace_back();
		} else if (c.is_object()) {
			out.push_back(stringField(c, {"text", "value", "label"}));
			ids.push_back(stringField(c, {"id"}));
		}
	}
	return out;
}

template <typename T>
T &as(QuizItem &item) { return std::get<T>(item); }

template <typename T>
const T &as(const QuizItem &item) { return std::get<T>(item); }

template <typename T>
void normalizeFreeText(QuizItem &item) {
	auto &it = as<T>(item);
	it.question = normalizeText(it.question);
	it.answer = normalizeText(it.answer);
}

template <typename T>
bool validateFreeText(const QuizItem &item) {
	const auto &it = as<T>(item);
	return !normalizeText(it.question).empty() && !normalizeText(it.answer).empty();
}

void noRepair(QuizItem &) {}

const std::array<ItemRules, kItemTypeCount> kRules = {{
	{[](QuizItem &i) { normalizeMcq(as<McqItem>(i)); },
	 [](QuizItem &i) { repairMcq(as<McqItem>(i)); },
	 [](const QuizItem &i) { return validateMcq(as<McqItem>(i)); }},
	{&normalizeFreeText<ShortAnswerItem>, &noRepair, &validateFreeText<ShortAnswerItem>},
	{[](QuizItem &i) { normalizeTrueFalse(as<TrueFalseItem>(i)); },
	 &noRepair,
	 [](const QuizItem &i) { return validateTrueFalse(as<TrueFalseItem>(i)); }},
	{&normalizeFreeText<IdentificationItem>, &noRepair, &validateFreeText<IdentificationItem>},
	{&normalizeFreeText<EssayItem>, &noRepair, &validateFreeText<EssayItem>},
}};

} // namespace

std::string toString(ItemType t) {
	switch (t) {
	case ItemType::Mcq: return "mcq";
	case ItemType::ShortAnswer: return "short_answer";
	case ItemType::TrueFalse: return "true_false";
	case ItemType::Identification: return "identification";
	case ItemType::Essay: return "essay";
	}
	return "mcq";
}

std::optional<ItemType> parseItemType(const std::string &s) {
	std::string t = textutil::lowerAscii(textutil::trimCopy(s));
	std::replace(t.begin(), t.end(), '-', '_');
	std::replace(t.begin(), t.end(), ' ', '_');
	if (t == "mcq" || t == "multiple_choice" || t == "multiplechoice") return ItemType::Mcq;
	if (t == "short_answer" || t == "shortanswer" || t == "short") return ItemType::ShortAnswer;
	if (t == "true_false" || t == "truefalse" || t == "tf" || t == "true/false") return ItemType::TrueFalse;
	if (t == "identification") return ItemType::Identification;
	if (t == "essay") return ItemType::Essay;
	return std::nullopt;
}

ItemType typeOf(const QuizItem &item) {
	return static_cast<ItemType>(item.index());
}

const std::string &questionOf(const QuizItem &item) {
	return std::visit([](const auto &it) -> const std::string & { return it.question; }, item);
}

std::optional<QuizItem> parseItem(const json &j) {
	if (!j.is_object()) return std::nullopt;
	auto type = parseItemType(stringField(j, {"type"}));
	if (!type) return std::nullopt;
	std::string question = stringField(j, {"question", "text"});
	switch (*type) {
	case ItemType::Mcq: {
		McqItem it;
		it.question = question;
		std::vector<std::string> ids;
		it.choices = choicesField(j, ids);
		it.answer = stringField(j, {"answer", "correct_answer"});
		// {"options": [{"id": "b", ...}], "correct_answer": "b"} names the choice by id
		for (size_t i = 0; i < ids.size() && i < it.choices.size(); i++) {
			if (!ids[i].empty() && ids[i] == it.answer) {
				it.answer = it.choices[i];
				break;
			}
		}
		return QuizItem{std::move(it)};
	}
	case ItemType::TrueFalse: {
		TrueFalseItem it;
		it.question = question;
		if (j.contains("answer")) it.answer = j["answer"];
		else if (j.contains("correct_answer")) it.answer = j["correct_answer"];
		return QuizItem{std::move(it)};
	}
	case ItemType::ShortAnswer:
		return QuizItem{ShortAnswerItem{question, stringField(j, {"answer", "correct_answer"})}};
	case ItemType::Identification:
		return QuizItem{IdentificationItem{question, stringField(j, {"answer", "correct_answer"})}};
	case ItemType::Essay:
		return QuizItem{EssayItem{question, stringField(j, {"answer", "correct_answer"})}};
	}
	return std::nullopt;
}

std::vector<QuizItem> parseItems(const json &array) {
	std::vector<QuizItem> out;
	if (!array.is_array()) return out;
	out.reserve(array.size());
	for (const auto &el : array) {
		auto item = parseItem(el);
		if (item) out.push_back(std::move(*item));
	}
	return out;
}

json toJson(const QuizItem &item) {
	json j{{"type", toString(typeOf(item))}, {"question", questionOf(item)}};
	switch (typeOf(item)) {
	case ItemType::Mcq:
		j["choices"] = as<McqItem>(item).choices;
		j["answer"] = as<McqItem>(item).answer;
		break;
	case ItemType::TrueFalse:
		j["answer"] = as<TrueFalseItem>(item).answer;
		break;
	case ItemType::ShortAnswer:
		j["answer"] = as<ShortAnswerItem>(item).answer;
		break;
	case ItemType::Identification:
		j["answer"] = as<IdentificationItem>(item).answer;
		break;
	case ItemType::Essay:
		j["answer"] = as<EssayItem>(item).answer;
		break;
	}
	return j;
}

json toJson(const std::vector<QuizItem> &items) {
	json out = json::array();
	for (const auto &it : items) out.push_back(toJson(it));
	return out;
}

void normalizeMcq(McqItem &item) {
	item.question = normalizeText(item.question);
	for (auto &c : item.choices) c = normalizeText(c);
	item.answer = normalizeText(item.answer);
}

void repairMcq(McqItem &item) {
	const std::string answer = normalizeText(item.answer);
	if (item.choices.size() > kMcqChoiceCount) {
		std::vector<std::string> kept;
		kept.reserve(kMcqChoiceCount);
		auto hit = std::find_if(item.choices.begin(), item.choices.end(),
								[&](const std::string &c) { return normalizeText(c) == answer; });
		if (hit != item.choices.end()) kept.push_back(*hit);
		for (auto it = item.choices.begin(); it != item.choices.end() && kept.size() < kMcqChoiceCount; ++it) {
			if (it != hit) kept.push_back(*it);
		}
		item.choices = std::move(kept);
	}

	for (const auto &c : item.choices) {
		if (normalizeText(c) == answer) {
			item.answer = c;
			return;
		}
	}

	const std::string needle = textutil::lowerAscii(answer);
	double best = -1.0;
	const std::string *bestChoice = nullptr;
	for (const auto &c : item.choices) {
		double score = textutil::similarityRatio(needle, textutil::lowerAscii(normalizeText(c)));
		if (score > best) {
			best = score;
			bestChoice = &c;
		}
	}
	if (bestChoice && best >= kAnswerMatchThreshold) item.answer = *bestChoice;
}

bool validateMcq(const McqItem &item) {
	if (normalizeText(item.question).empty()) return false;
	if (item.choices.size() != kMcqChoiceCount) return false;
	for (const auto &c : item.choices) {
		if (textutil::utf8Length(normalizeText(c)) < kMinChoiceLength) return false;
	}
	return std::find(item.choices.begin(), item.choices.end(), item.answer) != item.choices.end();
}

void normalizeTrueFalse(TrueFalseItem &item) {
	item.question = normalizeText(item.question);
	if (!item.answer.is_string()) return;
	std::string v = normalizeText(item.answer.get<std::string>());
	std::string lower = textutil::lowerAscii(v);
	if (lower == "true") item.answer = true;
	else if (lower == "false") item.answer = false;
	else item.answer = v;
}

bool validateTrueFalse(const TrueFalseItem &item) {
	return !normalizeText(item.question).empty() && item.answer.is_boolean();
}

const ItemRules &rulesFor(ItemType t) {
	return kRules[indexOf(t)];
}

Buckets partition(std::vector<QuizItem> items) {
	Buckets buckets;
	for (auto &item : items) {
		const auto &rules = rulesFor(typeOf(item));
		rules.normalize(item);
		rules.repair(item);
		if (!rules.validate(item)) continue;
		buckets[indexOf(typeOf(item))].push_back(std::move(item));
	}
	return buckets;
}

std::size_t totalSize(const Buckets &buckets) {
	std::size_t n = 0;
	for (const auto &b : buckets) n += b.size();
	return n;
}

} // namespace quiz

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace quiz {

using json = nlohmann::json;

// Declaration order is the output order of a generated quiz and the index of each QuizItem alternative.
enum class ItemType { Mcq = 0, ShortAnswer, TrueFalse, Identification, Essay };

constexpr std::size_t kItemTypeCount = 5;
constexpr std::array<ItemType, kItemTypeCount> kItemTypeOrder = {
	ItemType::Mcq, ItemType::ShortAnswer, ItemType::TrueFalse, ItemType::Identification, ItemType::Essay,
};

constexpr std::size_t kMcqChoiceCount = 4;
constexpr std::size_t kMinChoiceLength = 3;
// Minimum similarity for snapping a stray mcq answer onto one of its choices.
constexpr double kAnswerMatchThreshold = 0.6;

inline std::size_t indexOf(ItemType t) { return static_cast<std::size_t>(t); }
std::string toString(ItemType t);
std::optional<ItemType> parseItemType(const std::string &s);

struct McqItem {
	std::string question;
	std::vector<std::string> choices;
	std::string answer;
};

struct ShortAnswerItem {
	std::string question;
	std::string answer;
};

// answer stays as the provider sent it until normalization; only a JSON boolean is valid.
struct TrueFalseItem {
	std::string question;
	json answer;
};

struct IdentificationItem {
	std::string question;
	std::string answer;
};

struct EssayItem {
	std::string question;
	std::string answer;
};

using QuizItem = std::variant<McqItem, ShortAnswerItem, TrueFalseItem, IdentificationItem, EssayItem>;

ItemType typeOf(const QuizItem &item);
const std::string &questionOf(const QuizItem &item);

// nullopt for non-objects and unknown type tags.
std::optional<QuizItem> parseItem(const json &j);
std::vector<QuizItem> parseItems(const json &array);
json toJson(const QuizItem &item);
json toJson(const std::vector<QuizItem> &items);

void normalizeMcq(McqItem &item);
void repairMcq(McqItem &item);
bool validateMcq(const McqItem &item);

void normalizeTrueFalse(TrueFalseItem &item);
bool validateTrueFalse(const TrueFalseItem &item);

struct ItemRules {
	void (*normalize)(QuizItem &);
	void (*repair)(QuizItem &);
	bool (*validate)(const QuizItem &);
};

const ItemRules &rulesFor(ItemType t);

using Buckets = std::array<std::vector<QuizItem>, kItemTypeCount>;

// normalize -> repair -> validate each item; invalid items are dropped, order kept per bucket.
Buckets partition(std::vector<QuizItem> items);
std::size_t totalSize(const Buckets &buckets);

} // namespace quiz

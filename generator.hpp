#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dispatch.hpp"
#include "quiz_item.hpp"

namespace quiz {

enum class Difficulty { Easy, Intermediate, Difficult };

std::string toString(Difficulty d);
std::optional<Difficulty> parseDifficulty(const std::string &s);

// Indexed by ItemType, i.e. mcq, short_answer, true_false, identification, essay.
using TypeCounts = std::array<int, kItemTypeCount>;

constexpr int kMaxItemsPerType = 100;

int64_t totalCount(const TypeCounts &counts);
std::string describeCounts(const TypeCounts &counts);

struct RequestSpec {
	std::string sourceText;
	TypeCounts counts{};
	Difficulty difficulty{Difficulty::Intermediate};
};

enum class FailureKind { None, InvalidRequest, BudgetExhausted, DispatchFailed, ParseFailure, SchemaShortfall };

std::string toString(FailureKind f);

struct GenerationOutcome {
	bool ok{false};
	FailureKind failure{FailureKind::None};
	std::string error;
	std::vector<QuizItem> items;
	TypeCounts produced{};
	bool toppedUp{false};
};

struct GeneratorConfig {
	int outputTokenCap{4096};
	std::size_t maxSourceChars{20000};
	int minTopUpTokenCap{256};
	int maxItemsPerType{kMaxItemsPerType};
};

std::string buildGenerationPrompt(const std::string &text, const TypeCounts &counts, Difficulty difficulty);

TypeCounts countBuckets(const Buckets &buckets);
TypeCounts shortfall(const Buckets &buckets, const TypeCounts &requested);
int topUpOutputCap(int outputCap, const TypeCounts &missing, const TypeCounts &requested, int floorCap);
void mergeBuckets(Buckets &into, Buckets &&extra);
// Trims every bucket to its requested count and concatenates them in ItemType order.
std::vector<QuizItem> trimAndConcat(Buckets &buckets, const TypeCounts &requested);

class QuizGenerator {
public:
	QuizGenerator(std::shared_ptr<dispatch::Dispatcher> dispatcher, GeneratorConfig config);

	GenerationOutcome generate(const RequestSpec &spec);
	const GeneratorConfig &config() const { return config_; }

private:
	Buckets runRound(const std::string &prompt, int outputCap);
	GenerationOutcome reconcile(Buckets buckets, const RequestSpec &spec, const std::string &text);

	std::shared_ptr<dispatch::Dispatcher> dispatcher_;
	GeneratorConfig config_;
};

} // namespace quiz

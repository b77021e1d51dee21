#include <gtest/gtest.h>

#include "fakes.hpp"
#include "generator.hpp"

using quiz::json;
using testing_fakes::DispatchRig;

namespace {

json mcqJson(int n) {
	std::string tag = std::to_string(n);
	return json{{"type", "mcq"},
				{"question", "Multiple choice question " + tag + "?"},
				{"choices", {"Option A" + tag, "Option B" + tag, "Option C" + tag, "Option D" + tag}},
				{"answer", "Option B" + tag}};
}

json shortJson(int n) {
	return json{{"type", "short_answer"}, {"question", "Short question " + std::to_string(n) + "?"}, {"answer", "Answer " + std::to_string(n)}};
}

json tfJson(bool answer) {
	return json{{"type", "true_false"}, {"question", "Statement?"}, {"answer", answer}};
}

std::string fenced(const json &arr) {
	return "```json\n" + arr.dump() + "\n```";
}

quiz::RequestSpec request(int mcq, int shortAnswer, int trueFalse = 0) {
	quiz::RequestSpec spec;
	spec.sourceText = "Photosynthesis converts light energy into chemical energy stored in glucose.";
	spec.counts[quiz::indexOf(quiz::ItemType::Mcq)] = mcq;
	spec.counts[quiz::indexOf(quiz::ItemType::ShortAnswer)] = shortAnswer;
	spec.counts[quiz::indexOf(quiz::ItemType::TrueFalse)] = trueFalse;
	return spec;
}

std::vector<quiz::ItemType> typesOf(const std::vector<quiz::QuizItem> &items) {
	std::vector<quiz::ItemType> out;
	for (const auto &it : items) out.push_back(quiz::typeOf(it));
	return out;
}

bool mentions(const std::string &haystack, const std::string &needle) {
	return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(QuizGenerator, SatisfiedFirstPassIsOrderedByType) {
	DispatchRig rig;
	rig.client->pushContent(fenced(json::array({tfJson(true), shortJson(1), mcqJson(1)})));
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});
	auto out = gen.generate(request(1, 1, 1));
	ASSERT_TRUE(out.ok) << out.error;
	EXPECT_FALSE(out.toppedUp);
	EXPECT_EQ(typesOf(out.items),
			  (std::vector<quiz::ItemType>{quiz::ItemType::Mcq, quiz::ItemType::ShortAnswer, quiz::ItemType::TrueFalse}));
	EXPECT_EQ(rig.client->requests.size(), 1u);
}

TEST(QuizGenerator, SurplusItemsAreTrimmed) {
	DispatchRig rig;
	rig.client->pushContent(json::array({mcqJson(1), mcqJson(2), mcqJson(3), shortJson(1), shortJson(2)}).dump());
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});
	auto out = gen.generate(request(2, 1));
	ASSERT_TRUE(out.ok) << out.error;
	ASSERT_EQ(out.items.size(), 3u);
	EXPECT_EQ(quiz::questionOf(out.items[0]), "Multiple choice question 1?");
	EXPECT_EQ(quiz::questionOf(out.items[1]), "Multiple choice question 2?");
	EXPECT_EQ(quiz::questionOf(out.items[2]), "Short question 1?");
}

TEST(QuizGenerator, SingleTopUpCoversOnlyTheShortfall) {
	DispatchRig rig;
	rig.client->pushContent(json::array({mcqJson(1), shortJson(1), mcqJson(2), shortJson(2)}).dump());
	rig.client->pushContent(json::array({mcqJson(3), shortJson(3)}).dump());
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});

	auto out = gen.generate(request(3, 2));
	ASSERT_TRUE(out.ok) << out.error;
	EXPECT_TRUE(out.toppedUp);
	ASSERT_EQ(rig.client->requests.size(), 2u);

	const auto &topUp = rig.client->requests[1];
	EXPECT_TRUE(mentions(topUp.prompt, "a total of 1 questions"));
	EXPECT_TRUE(mentions(topUp.prompt, "- 1 Multiple Choice Questions"));
	EXPECT_FALSE(mentions(topUp.prompt, "Short Answer Questions"));
	EXPECT_EQ(topUp.maxTokens, 820);

	EXPECT_EQ(typesOf(out.items),
			  (std::vector<quiz::ItemType>{quiz::ItemType::Mcq, quiz::ItemType::Mcq, quiz::ItemType::Mcq,
										   quiz::ItemType::ShortAnswer, quiz::ItemType::ShortAnswer}));
	EXPECT_EQ(quiz::questionOf(out.items[2]), "Multiple choice question 3?");
	EXPECT_EQ(quiz::questionOf(out.items[4]), "Short question 2?");
}

TEST(QuizGenerator, UnfilledGapAfterTopUpIsSchemaShortfall) {
	DispatchRig rig;
	rig.client->pushContent(json::array({mcqJson(1), mcqJson(2), shortJson(1), shortJson(2)}).dump());
	rig.client->pushContent(json::array({shortJson(3)}).dump());
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});

	auto out = gen.generate(request(3, 2));
	EXPECT_FALSE(out.ok);
	EXPECT_EQ(out.failure, quiz::FailureKind::SchemaShortfall);
	EXPECT_TRUE(out.items.empty());
	EXPECT_EQ(out.produced[quiz::indexOf(quiz::ItemType::Mcq)], 2);
	EXPECT_EQ(rig.client->requests.size(), 2u);
}

TEST(QuizGenerator, FailedTopUpContributesNothing) {
	DispatchRig rig;
	rig.client->pushContent(json::array({mcqJson(1), shortJson(1)}).dump());
	// every later call falls through to the scripted 500 reply
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});

	auto out = gen.generate(request(2, 1));
	EXPECT_FALSE(out.ok);
	EXPECT_EQ(out.failure, quiz::FailureKind::SchemaShortfall);
	EXPECT_TRUE(out.items.empty());
}

TEST(QuizGenerator, InvalidItemsCountAsMissing) {
	DispatchRig rig;
	json bad = mcqJson(9);
	bad["choices"] = {"A", "B", "C", "D"};
	rig.client->pushContent(json::array({bad, shortJson(1)}).dump());
	rig.client->pushContent(json::array({mcqJson(1)}).dump());
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});

	auto out = gen.generate(request(1, 1));
	ASSERT_TRUE(out.ok) << out.error;
	EXPECT_EQ(quiz::questionOf(out.items[0]), "Multiple choice question 1?");
}

TEST(QuizGenerator, UnparseableOutputIsParseFailure) {
	DispatchRig rig;
	rig.client->pushContent("<think>planning</think>I'm sorry, I can't produce that.");
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});
	auto out = gen.generate(request(1, 0));
	EXPECT_FALSE(out.ok);
	EXPECT_EQ(out.failure, quiz::FailureKind::ParseFailure);
	EXPECT_EQ(rig.client->requests.size(), 1u);
}

TEST(QuizGenerator, ExhaustedBudgetIsReported) {
	DispatchRig rig;
	rig.cooldowns->setCooldown("primary", std::chrono::seconds(60));
	rig.cooldowns->setCooldown("secondary", std::chrono::seconds(60));
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});
	auto out = gen.generate(request(1, 0));
	EXPECT_EQ(out.failure, quiz::FailureKind::BudgetExhausted);
	EXPECT_TRUE(rig.client->requests.empty());
}

TEST(QuizGenerator, ProviderFailureIsDispatchFailed) {
	DispatchRig rig;
	rig.client->pushError(401, "invalid_api_key", "Invalid API Key");
	rig.client->pushError(401, "invalid_api_key", "Invalid API Key");
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});
	auto out = gen.generate(request(1, 0));
	EXPECT_EQ(out.failure, quiz::FailureKind::DispatchFailed);
}

TEST(QuizGenerator, RejectsEmptyRequestsWithoutCalling) {
	DispatchRig rig;
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});
	auto spec = request(1, 0);
	spec.sourceText = "  \n ";
	EXPECT_EQ(gen.generate(spec).failure, quiz::FailureKind::InvalidRequest);
	EXPECT_EQ(gen.generate(request(0, 0)).failure, quiz::FailureKind::InvalidRequest);
	EXPECT_EQ(gen.generate(request(-1, 2)).failure, quiz::FailureKind::InvalidRequest);
	EXPECT_TRUE(rig.client->requests.empty());
}

TEST(QuizGenerator, CountsAbovePerTypeCapAreRejected) {
	DispatchRig rig;
	rig.client->pushContent(json::array({mcqJson(1)}).dump());
	quiz::QuizGenerator gen(rig.dispatcher, quiz::GeneratorConfig{});
	auto out = gen.generate(request(2000000000, 2000000000));
	EXPECT_FALSE(out.ok);
	EXPECT_EQ(out.failure, quiz::FailureKind::InvalidRequest);
	EXPECT_TRUE(out.items.empty());

	quiz::GeneratorConfig small;
	small.maxItemsPerType = 3;
	quiz::QuizGenerator capped(rig.dispatcher, small);
	EXPECT_EQ(capped.generate(request(4, 0)).failure, quiz::FailureKind::InvalidRequest);
	EXPECT_TRUE(rig.client->requests.empty());
}

TEST(QuizGenerator, TotalCountDoesNotOverflow) {
	quiz::TypeCounts counts{};
	counts.fill(2000000000);
	EXPECT_EQ(quiz::totalCount(counts), int64_t{10000000000});
}

TEST(QuizGenerator, LongSourceIsTruncated) {
	DispatchRig rig({"primary"}, budget::BudgetLimits{0, 0, 0, 0});
	rig.client->pushContent(json::array({mcqJson(1)}).dump());
	quiz::GeneratorConfig cfg;
	cfg.maxSourceChars = 1000;
	quiz::QuizGenerator gen(rig.dispatcher, cfg);
	auto spec = request(1, 0);
	spec.sourceText = std::string(5000, 'a');
	ASSERT_TRUE(gen.generate(spec).ok);
	const auto &prompt = rig.client->requests[0].prompt;
	EXPECT_TRUE(mentions(prompt, std::string(1000, 'a')));
	EXPECT_FALSE(mentions(prompt, std::string(1001, 'a')));
}

TEST(GenerationPrompt, ListsOnlyRequestedTypes) {
	quiz::TypeCounts counts{};
	counts[quiz::indexOf(quiz::ItemType::TrueFalse)] = 4;
	counts[quiz::indexOf(quiz::ItemType::Essay)] = 1;
	auto prompt = quiz::buildGenerationPrompt("Material body", counts, quiz::Difficulty::Difficult);
	EXPECT_TRUE(mentions(prompt, "a total of 5 questions at Difficult difficulty"));
	EXPECT_TRUE(mentions(prompt, "- 4 True/False Questions"));
	EXPECT_TRUE(mentions(prompt, "- 1 Essay Questions"));
	EXPECT_TRUE(mentions(prompt, "\"type\": \"essay\""));
	EXPECT_FALSE(mentions(prompt, "\"type\": \"mcq\""));
	EXPECT_TRUE(mentions(prompt, "\"\"\"\nMaterial body\n\"\"\""));
}

TEST(Reconciler, TopUpCapScalesWithShortfallAndHasFloor) {
	quiz::TypeCounts requested{5, 0, 0, 0, 0};
	quiz::TypeCounts missing{1, 0, 0, 0, 0};
	EXPECT_EQ(quiz::topUpOutputCap(4096, missing, requested, 256), 820);
	quiz::TypeCounts many{50, 0, 0, 0, 0};
	EXPECT_EQ(quiz::topUpOutputCap(4096, missing, many, 256), 256);
	EXPECT_EQ(quiz::topUpOutputCap(100, missing, many, 256), 100);
}

TEST(Difficulty, ParsesCommonSpellings) {
	EXPECT_EQ(quiz::parseDifficulty("easy"), quiz::Difficulty::Easy);
	EXPECT_EQ(quiz::parseDifficulty(" Hard "), quiz::Difficulty::Difficult);
	EXPECT_EQ(quiz::parseDifficulty("Intermediate"), quiz::Difficulty::Intermediate);
	EXPECT_FALSE(quiz::parseDifficulty("impossible").has_value());
}

#include <gtest/gtest.h>

#include "output_parser.hpp"

using quiz::json;

TEST(SanitizeOutput, DropsThinkBlocksAndFences) {
	std::string raw = "<THINK>\nlet me plan the quiz\n</think>\nSure! Here it is:\n```json\n[{\"a\": 1}]\n```\nEnjoy.";
	EXPECT_EQ(quiz::sanitizeOutput(raw), "[{\"a\": 1}]");
}

TEST(SanitizeOutput, KeepsOnlyTheFirstFence) {
	std::string raw = "```\n[1, 2]\n```\nand also\n```json\n[3]\n```";
	EXPECT_EQ(quiz::sanitizeOutput(raw), "[1, 2]");
}

TEST(SanitizeOutput, RemovesBomAndStrayBackticks) {
	EXPECT_EQ(quiz::sanitizeOutput("\xEF\xBB\xBF  [true]` \n"), "[true]");
}

TEST(SanitizeOutput, IsIdempotent) {
	const std::vector<std::string> inputs = {
		"<think>x</think>```json\n[1]\n```",
		"plain [1, 2, 3] text",
		"```JSON\n```json\n[]\n```\n```",
		"`` [\"a\"] ``",
		"",
		"<think>unterminated [1]",
	};
	for (const auto &in : inputs) {
		std::string once = quiz::sanitizeOutput(in);
		EXPECT_EQ(quiz::sanitizeOutput(once), once) << "input: " << in;
	}
}

TEST(ExtractJsonArray, RecoversArrayFromProse) {
	auto arr = quiz::parseProviderOutput(
		"Here are your questions:\n[{\"type\": \"essay\", \"question\": \"Why?\", \"answer\": \"Because [reasons].\"}]\nGood luck!");
	ASSERT_TRUE(arr.is_array());
	ASSERT_EQ(arr.size(), 1u);
	EXPECT_EQ(arr[0]["answer"], "Because [reasons].");
}

TEST(ExtractJsonArray, RecoversArrayFromFencedBlockWithProse) {
	json expected = json::array({json{{"type", "true_false"}, {"question", "Q"}, {"answer", false}}});
	std::string raw = "Okay.\n```json\n" + expected.dump(2) + "\n```\nLet me know if you need more.";
	EXPECT_EQ(quiz::parseProviderOutput(raw), expected);
}

TEST(ExtractJsonArray, ThrowsWhenNoArray) {
	EXPECT_THROW(quiz::extractJsonArray("I cannot help with that."), quiz::ParseFailure);
	EXPECT_THROW(quiz::extractJsonArray("] backwards ["), quiz::ParseFailure);
}

TEST(ExtractJsonArray, ThrowsOnMalformedArray) {
	EXPECT_THROW(quiz::extractJsonArray("[{\"question\": \"unterminated}]"), quiz::ParseFailure);
}

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "dispatch.hpp"
#include "quiz_item.hpp"

namespace grading {

enum class GradeMethod { ExactMatch, Model, LexicalFallback };

std::string toString(GradeMethod m);

struct GradeResult {
	bool correct{false};
	GradeMethod method{GradeMethod::ExactMatch};
};

// Output cap for a TRUE/FALSE verdict.
constexpr int kVerdictTokenCap = 5;
// Share of the reference's key points a free-text answer must cover.
constexpr int kCoveragePercent = 40;

constexpr std::size_t kMinSharedTokens = 3;
constexpr double kMinSharedShare = 0.5;
constexpr double kMinSimilarity = 0.80;

// Lower-cased, a leading "the"/"a"/"an" dropped, non-alphanumerics removed.
std::string normalizeIdentification(const std::string &s);

std::string buildGradingPrompt(const std::string &question, const std::string &reference, const std::string &student);

// true/false when exactly one of the two words appears in the cleaned output, otherwise nullopt.
std::optional<bool> parseVerdict(const std::string &output);

bool lexicalFallback(const std::string &student, const std::string &reference);

class Grader {
public:
	explicit Grader(std::shared_ptr<dispatch::Dispatcher> dispatcher);

	GradeResult grade(quiz::ItemType type, const std::string &question, const std::string &student,
					  const std::string &reference);

private:
	GradeResult gradeFreeText(const std::string &question, const std::string &student, const std::string &reference);

	std::shared_ptr<dispatch::Dispatcher> dispatcher_;
};

} // namespace grading

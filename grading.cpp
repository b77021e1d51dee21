#include "grading.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <vector>

#include "output_parser.hpp"
#include "text_util.hpp"

namespace grading {

namespace {

bool isArticle(const std::string &w) {
	return w == "the" || w == "a" || w == "an";
}

std::string comparable(const std::string &s) {
	return textutil::lowerAscii(textutil::normalizeText(s));
}

} // namespace

std::string toString(GradeMethod m) {
	switch (m) {
	case GradeMethod::ExactMatch: return "exact";
	case GradeMethod::Model: return "model";
	case GradeMethod::LexicalFallback: return "lexical";
	}
	return "exact";
}

std::string normalizeIdentification(const std::string &s) {
	auto words = textutil::wordTokens(s);
	size_t start = (words.size() > 1 && isArticle(words.front())) ? 1 : 0;
	std::string out;
	for (size_t i = start; i < words.size(); i++) out += words[i];
	return out;
}

std::string buildGradingPrompt(const std::string &question, const std::string &reference, const std::string &student) {
	std::ostringstream ss;
	ss << "You are grading a student's answer to a quiz question.\n\n"
	   << "Question:\n" << question << "\n\n"
	   << "Reference answer:\n" << reference << "\n\n"
	   << "Student answer:\n" << student << "\n\n"
	   << "The student answer is correct if it covers at least " << kCoveragePercent
	   << "% of the key points of the reference answer, in any wording. Ignore spelling and grammar.\n"
	   << "Reply with exactly one word: TRUE if the answer is correct, FALSE otherwise. Output nothing else.";
	return ss.str();
}

std::optional<bool> parseVerdict(const std::string &output) {
	std::string cleaned = textutil::lowerAscii(quiz::sanitizeOutput(output));
	bool hasTrue = cleaned.find("true") != std::string::npos;
	bool hasFalse = cleaned.find("false") != std::string::npos;
	if (hasTrue == hasFalse) return std::nullopt;
	return hasTrue;
}

bool lexicalFallback(const std::string &student, const std::string &reference) {
	auto studentWords = textutil::wordTokens(student);
	auto referenceWords = textutil::wordTokens(reference);
	std::set<std::string> studentSet(studentWords.begin(), studentWords.end());
	std::set<std::string> referenceSet(referenceWords.begin(), referenceWords.end());

	std::size_t shared = 0;
	for (const auto &w : referenceSet) {
		if (studentSet.count(w)) shared++;
	}
	if (shared >= kMinSharedTokens) return true;
	if (!referenceSet.empty() && static_cast<double>(shared) >= kMinSharedShare * referenceSet.size()) return true;
	return textutil::similarityRatio(comparable(student), comparable(reference)) >= kMinSimilarity;
}

Grader::Grader(std::shared_ptr<dispatch::Dispatcher> dispatcher) : dispatcher_(std::move(dispatcher)) {}

GradeResult Grader::grade(quiz::ItemType type, const std::string &question, const std::string &student,
						  const std::string &reference) {
	GradeResult res;
	if (textutil::trimCopy(student).empty()) return res;

	switch (type) {
	case quiz::ItemType::Identification: {
		std::string a = normalizeIdentification(student);
		std::string b = normalizeIdentification(reference);
		// punctuation-only answers have no words left to compare
		res.correct = (a.empty() && b.empty()) ? comparable(student) == comparable(reference) : a == b;
		return res;
	}
	case quiz::ItemType::Mcq:
	case quiz::ItemType::TrueFalse:
		res.correct = comparable(student) == comparable(reference);
		return res;
	case quiz::ItemType::ShortAnswer:
	case quiz::ItemType::Essay:
		return gradeFreeText(question, student, reference);
	}
	return res;
}

GradeResult Grader::gradeFreeText(const std::string &question, const std::string &student, const std::string &reference) {
	GradeResult res;
	dispatch::CallOptions opts;
	opts.temperature = 0.0;
	opts.stop = std::vector<std::string>{};
	try {
		auto reply = dispatcher_->dispatch(buildGradingPrompt(question, reference, student), kVerdictTokenCap, opts);
		auto verdict = parseVerdict(reply.content);
		if (verdict) {
			res.correct = *verdict;
			res.method = GradeMethod::Model;
			return res;
		}
		std::cerr << "[Grading] ambiguous verdict from " << reply.model << ": " << textutil::truncateUtf8(reply.content, 120) << std::endl;
	} catch (const std::runtime_error &e) {
		std::cerr << "[Grading] model grading unavailable: " << e.what() << std::endl;
	}
	res.correct = lexicalFallback(student, reference);
	res.method = GradeMethod::LexicalFallback;
	return res;
}

} // namespace grading

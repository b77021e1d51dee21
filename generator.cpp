#include "generator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <sstream>

#include "output_parser.hpp"
#include "text_util.hpp"

namespace quiz {

namespace {

const char *kTypeLines[kItemTypeCount] = {
	"Multiple Choice Questions (exactly 4 choices each, one of them correct)",
	"Short Answer Questions",
	"True/False Questions (answer is the JSON boolean true or false)",
	"Identification Questions (answer is a single term, name or phrase)",
	"Essay Questions (answer is a model answer of 2 to 4 sentences)",
};

const char *kTypeExamples[kItemTypeCount] = {
	R"(  {
    "type": "mcq",
    "question": "...",
    "choices": ["...", "...", "...", "..."],
    "answer": "..."
  })",
	R"(  {
    "type": "short_answer",
    "question": "...",
    "answer": "..."
  })",
	R"(  {
    "type": "true_false",
    "question": "...",
    "answer": true
  })",
	R"(  {
    "type": "identification",
    "question": "...",
    "answer": "..."
  })",
	R"(  {
    "type": "essay",
    "question": "...",
    "answer": "..."
  })",
};

const char *difficultyGuidance(Difficulty d) {
	switch (d) {
	case Difficulty::Easy: return "recall of facts stated directly in the material";
	case Difficulty::Intermediate: return "understanding and applying the ideas in the material";
	case Difficulty::Difficult: return "analysis and inference that combines several parts of the material";
	}
	return "understanding and applying the ideas in the material";
}

GenerationOutcome failed(FailureKind kind, const std::string &error) {
	GenerationOutcome out;
	out.ok = false;
	out.failure = kind;
	out.error = error;
	return out;
}

} // namespace

std::string toString(Difficulty d) {
	switch (d) {
	case Difficulty::Easy: return "Easy";
	case Difficulty::Intermediate: return "Intermediate";
	case Difficulty::Difficult: return "Difficult";
	}
	return "Intermediate";
}

std::optional<Difficulty> parseDifficulty(const std::string &s) {
	std::string t = textutil::lowerAscii(textutil::trimCopy(s));
	if (t == "easy") return Difficulty::Easy;
	if (t == "intermediate" || t == "medium" || t == "normal") return Difficulty::Intermediate;
	if (t == "difficult" || t == "hard") return Difficulty::Difficult;
	return std::nullopt;
}

int64_t totalCount(const TypeCounts &counts) {
	int64_t n = 0;
	for (int c : counts) n += std::max(0, c);
	return n;
}

std::string describeCounts(const TypeCounts &counts) {
	std::ostringstream ss;
	bool first = true;
	for (auto t : kItemTypeOrder) {
		if (!first) ss << ", ";
		first = false;
		ss << toString(t) << "=" << counts[indexOf(t)];
	}
	return ss.str();
}

std::string toString(FailureKind f) {
	switch (f) {
	case FailureKind::None: return "none";
	case FailureKind::InvalidRequest: return "invalid_request";
	case FailureKind::BudgetExhausted: return "budget_exhausted";
	case FailureKind::DispatchFailed: return "dispatch_failed";
	case FailureKind::ParseFailure: return "parse_failure";
	case FailureKind::SchemaShortfall: return "schema_shortfall";
	}
	return "none";
}

std::string buildGenerationPrompt(const std::string &text, const TypeCounts &counts, Difficulty difficulty) {
	std::ostringstream ss;
	ss << "From the following learning material, generate a quiz with a total of " << totalCount(counts)
	   << " questions at " << toString(difficulty) << " difficulty (" << difficultyGuidance(difficulty) << ").\n\n";
	for (auto t : kItemTypeOrder) {
		int n = counts[indexOf(t)];
		if (n > 0) ss << "- " << n << " " << kTypeLines[indexOf(t)] << ".\n";
	}
	ss << "\nKeep every question and answer concise. MCQ choices must be short phrases (1 to 5 words) "
		  "and the MCQ \"answer\" must be copied exactly from its \"choices\".\n"
		  "Do NOT include numbering or extra text. Only return the JSON array.\n\n"
		  "Respond ONLY with a JSON array in this format, without adding any explanation or preamble:\n[\n";
	bool first = true;
	for (auto t : kItemTypeOrder) {
		if (counts[indexOf(t)] <= 0) continue;
		if (!first) ss << ",\n";
		first = false;
		ss << kTypeExamples[indexOf(t)];
	}
	ss << "\n]\n\nLearning Material:\n\"\"\"\n" << text << "\n\"\"\"";
	return ss.str();
}

TypeCounts countBuckets(const Buckets &buckets) {
	TypeCounts out{};
	for (size_t i = 0; i < kItemTypeCount; i++) out[i] = static_cast<int>(buckets[i].size());
	return out;
}

TypeCounts shortfall(const Buckets &buckets, const TypeCounts &requested) {
	TypeCounts out{};
	for (size_t i = 0; i < kItemTypeCount; i++) {
		out[i] = std::max(0, requested[i] - static_cast<int>(buckets[i].size()));
	}
	return out;
}

int topUpOutputCap(int outputCap, const TypeCounts &missing, const TypeCounts &requested, int floorCap) {
	int64_t total = totalCount(requested);
	if (total <= 0) return outputCap;
	double share = static_cast<double>(totalCount(missing)) / total;
	int cap = static_cast<int>(std::ceil(outputCap * share));
	return std::min(outputCap, std::max(std::min(floorCap, outputCap), cap));
}

void mergeBuckets(Buckets &into, Buckets &&extra) {
	for (size_t i = 0; i < kItemTypeCount; i++) {
		auto &dst = into[i];
		dst.insert(dst.end(), std::make_move_iterator(extra[i].begin()), std::make_move_iterator(extra[i].end()));
	}
}

std::vector<QuizItem> trimAndConcat(Buckets &buckets, const TypeCounts &requested) {
	std::vector<QuizItem> out;
	for (auto t : kItemTypeOrder) {
		auto &b = buckets[indexOf(t)];
		size_t want = static_cast<size_t>(std::max(0, requested[indexOf(t)]));
		if (b.size() > want) b.resize(want);
		out.insert(out.end(), std::make_move_iterator(b.begin()), std::make_move_iterator(b.end()));
	}
	return out;
}

QuizGenerator::QuizGenerator(std::shared_ptr<dispatch::Dispatcher> dispatcher, GeneratorConfig config)
	: dispatcher_(std::move(dispatcher)), config_(config) {}

Buckets QuizGenerator::runRound(const std::string &prompt, int outputCap) {
	auto reply = dispatcher_->dispatch(prompt, outputCap);
	json arr;
	try {
		arr = parseProviderOutput(reply.content);
	} catch (const ParseFailure &e) {
		std::cerr << "[Generator] " << e.what() << "; raw output: "
				  << textutil::truncateUtf8(reply.content, 600) << std::endl;
		throw;
	}
	auto items = parseItems(arr);
	size_t parsed = items.size();
	auto buckets = partition(std::move(items));
	size_t kept = totalSize(buckets);
	std::cout << "[Generator] " << reply.model << ": " << arr.size() << " raw, " << kept << " valid";
	if (arr.size() > kept) std::cout << " (" << (arr.size() - parsed) << " unparseable, " << (parsed - kept) << " invalid)";
	std::cout << std::endl;
	return buckets;
}

GenerationOutcome QuizGenerator::reconcile(Buckets buckets, const RequestSpec &spec, const std::string &text) {
	GenerationOutcome outcome;
	TypeCounts missing = shortfall(buckets, spec.counts);
	if (totalCount(missing) > 0) {
		int cap = topUpOutputCap(config_.outputTokenCap, missing, spec.counts, config_.minTopUpTokenCap);
		std::cout << "[Generator] top-up for " << describeCounts(missing) << " (cap " << cap << ")" << std::endl;
		outcome.toppedUp = true;
		try {
			mergeBuckets(buckets, runRound(buildGenerationPrompt(text, missing, spec.difficulty), cap));
		} catch (const std::runtime_error &e) {
			std::cerr << "[Generator] top-up failed: " << e.what() << std::endl;
		}
	}

	outcome.produced = countBuckets(buckets);
	outcome.items = trimAndConcat(buckets, spec.counts);
	const int64_t want = totalCount(spec.counts);
	if (static_cast<int64_t>(outcome.items.size()) < want) {
		outcome.items.clear();
		outcome.failure = FailureKind::SchemaShortfall;
		outcome.error = "only " + describeCounts(outcome.produced) + " valid items for requested " + describeCounts(spec.counts);
		std::cerr << "[Generator] " << outcome.error << std::endl;
		return outcome;
	}
	outcome.ok = true;
	return outcome;
}

GenerationOutcome QuizGenerator::generate(const RequestSpec &spec) {
	if (textutil::trimCopy(spec.sourceText).empty()) return failed(FailureKind::InvalidRequest, "source text is empty");
	for (int c : spec.counts) {
		if (c < 0) return failed(FailureKind::InvalidRequest, "question counts must be non-negative");
		if (c > config_.maxItemsPerType) {
			return failed(FailureKind::InvalidRequest,
						  "at most " + std::to_string(config_.maxItemsPerType) + " questions per type");
		}
	}
	if (totalCount(spec.counts) == 0) return failed(FailureKind::InvalidRequest, "no questions requested");

	std::string text = textutil::truncateUtf8(spec.sourceText, config_.maxSourceChars);
	if (text.size() < spec.sourceText.size()) {
		std::cout << "[Generator] source text truncated from " << spec.sourceText.size() << " to " << text.size() << " bytes" << std::endl;
	}

	Buckets buckets;
	try {
		buckets = runRound(buildGenerationPrompt(text, spec.counts, spec.difficulty), config_.outputTokenCap);
	} catch (const dispatch::BudgetExhausted &e) {
		return failed(FailureKind::BudgetExhausted, e.what());
	} catch (const dispatch::DispatchFailure &e) {
		return failed(FailureKind::DispatchFailed, e.what());
	} catch (const ParseFailure &e) {
		return failed(FailureKind::ParseFailure, e.what());
	}
	return reconcile(std::move(buckets), spec, text);
}

} // namespace quiz

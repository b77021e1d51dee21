#include "quiz_service.hpp"

#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

namespace service {

namespace {

ServiceReply errorReply(int status, const std::string &error) {
	return ServiceReply{status, json{{"ok", false}, {"error", error}}};
}

json countsJson(const quiz::TypeCounts &counts) {
	json out = json::object();
	for (auto t : quiz::kItemTypeOrder) out[quiz::toString(t)] = counts[quiz::indexOf(t)];
	return out;
}

int64_t epochSeconds(budget::TimePoint tp) {
	return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

// Student answers arrive as strings, or as booleans for true_false.
bool answerText(const json &v, std::string &out) {
	if (v.is_string()) {
		out = v.get<std::string>();
		return true;
	}
	if (v.is_boolean()) {
		out = v.get<bool>() ? "true" : "false";
		return true;
	}
	return false;
}

} // namespace

int httpStatusFor(quiz::FailureKind failure) {
	switch (failure) {
	case quiz::FailureKind::None: return 200;
	case quiz::FailureKind::InvalidRequest: return 400;
	case quiz::FailureKind::BudgetExhausted: return 429;
	case quiz::FailureKind::DispatchFailed: return 502;
	case quiz::FailureKind::ParseFailure: return 500;
	case quiz::FailureKind::SchemaShortfall: return 422;
	}
	return 500;
}

bool parseRequestSpec(const json &body, quiz::RequestSpec &spec, std::string &error, int maxPerType) {
	if (!body.is_object()) {
		error = "request body must be a JSON object";
		return false;
	}
	if (!body.contains("text") || !body["text"].is_string()) {
		error = "text must be a string";
		return false;
	}
	spec.sourceText = body["text"].get<std::string>();

	spec.counts.fill(0);
	if (!body.contains("counts") || !body["counts"].is_object()) {
		error = "counts must be an object";
		return false;
	}
	for (auto it = body["counts"].begin(); it != body["counts"].end(); ++it) {
		auto type = quiz::parseItemType(it.key());
		if (!type) {
			error = "unknown question type: " + it.key();
			return false;
		}
		if (!it.value().is_number_integer() || it.value().get<int64_t>() < 0) {
			error = "count for " + it.key() + " must be a non-negative integer";
			return false;
		}
		if (it.value().is_number_unsigned() ? it.value().get<uint64_t>() > static_cast<uint64_t>(maxPerType)
											: it.value().get<int64_t>() > maxPerType) {
			error = "count for " + it.key() + " must be at most " + std::to_string(maxPerType);
			return false;
		}
		spec.counts[quiz::indexOf(*type)] = static_cast<int>(it.value().get<int64_t>());
	}

	spec.difficulty = quiz::Difficulty::Intermediate;
	if (body.contains("difficulty") && !body["difficulty"].is_null()) {
		const auto &d = body["difficulty"];
		auto parsed = d.is_string() ? quiz::parseDifficulty(d.get<std::string>()) : std::nullopt;
		if (!parsed) {
			error = "difficulty must be Easy, Intermediate or Difficult";
			return false;
		}
		spec.difficulty = *parsed;
	}
	return true;
}

QuizService::QuizService(std::shared_ptr<quiz::QuizGenerator> generator,
						 std::shared_ptr<grading::Grader> grader,
						 std::shared_ptr<answers::AnswerKeyStore> answers,
						 std::shared_ptr<budget::BudgetTracker> budget,
						 std::shared_ptr<budget::CooldownRegistry> cooldowns,
						 IdSource nextId)
	: generator_(std::move(generator)),
	  grader_(std::move(grader)),
	  answers_(std::move(answers)),
	  budget_(std::move(budget)),
	  cooldowns_(std::move(cooldowns)),
	  nextId_(std::move(nextId)) {}

ServiceReply QuizService::generateQuiz(const json &body) {
	quiz::RequestSpec spec;
	std::string error;
	if (!parseRequestSpec(body, spec, error, generator_->config().maxItemsPerType)) return errorReply(400, error);

	auto outcome = generator_->generate(spec);
	if (!outcome.ok) {
		ServiceReply reply = errorReply(httpStatusFor(outcome.failure), outcome.error);
		reply.body["failure"] = quiz::toString(outcome.failure);
		if (outcome.failure == quiz::FailureKind::SchemaShortfall) {
			reply.body["requested"] = countsJson(spec.counts);
			reply.body["produced"] = countsJson(outcome.produced);
		}
		return reply;
	}

	json items = json::array();
	std::vector<std::pair<std::string, answers::AnswerKey>> keys;
	keys.reserve(outcome.items.size());
	for (const auto &item : outcome.items) {
		std::string id = nextId_();
		json j = quiz::toJson(item);
		j["id"] = id;
		items.push_back(std::move(j));
		keys.emplace_back(id, answers::AnswerKey{quiz::typeOf(item), quiz::questionOf(item), answers::referenceAnswer(item)});
	}

	bool stored = true;
	try {
		answers_->putAll(keys);
	} catch (const std::exception &e) {
		stored = false;
		std::cerr << "[Service] could not persist answer keys: " << e.what() << std::endl;
	}
	return ServiceReply{200, json{{"ok", true}, {"items", items}, {"stored", stored}, {"toppedUp", outcome.toppedUp}}};
}

ServiceReply QuizService::grade(const json &body) {
	if (!body.is_object()) return errorReply(400, "request body must be a JSON object");
	std::string student;
	if (!body.contains("answer") || !answerText(body["answer"], student)) {
		return errorReply(400, "answer must be a string or boolean");
	}

	answers::AnswerKey key;
	if (body.contains("questionId")) {
		if (!body["questionId"].is_string()) return errorReply(400, "questionId must be a string");
		auto found = answers_->find(body["questionId"].get<std::string>());
		if (!found) return errorReply(404, "unknown questionId");
		key = *found;
	} else {
		auto type = body.contains("type") && body["type"].is_string()
						? quiz::parseItemType(body["type"].get<std::string>())
						: std::nullopt;
		if (!type) return errorReply(400, "type must name a question type");
		if (!body.contains("reference") || !answerText(body["reference"], key.answer)) {
			return errorReply(400, "reference must be a string or boolean");
		}
		key.type = *type;
		key.question = body.value("question", "");
	}

	auto res = grader_->grade(key.type, key.question, student, key.answer);
	return ServiceReply{200, json{{"ok", true}, {"correct", res.correct}, {"method", grading::toString(res.method)}}};
}

json QuizService::budgetStatus() {
	auto s = budget_->snapshot();
	json cooldowns = json::object();
	for (const auto &kv : cooldowns_->active()) cooldowns[kv.first] = epochSeconds(kv.second);
	return json{
		{"ok", true},
		{"usage", {{"requestsThisMinute", s.requestsThisMinute}, {"requestsToday", s.requestsToday},
				   {"tokensThisMinute", s.tokensThisMinute}, {"tokensToday", s.tokensToday}}},
		{"limits", {{"rpm", s.limits.rpm}, {"rpd", s.limits.rpd}, {"tpm", s.limits.tpm}, {"tpd", s.limits.tpd}}},
		{"cooldownUntil", cooldowns},
	};
}

} // namespace service

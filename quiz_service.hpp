#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "answer_store.hpp"
#include "budget.hpp"
#include "generator.hpp"
#include "grading.hpp"

namespace service {

using json = nlohmann::json;

struct ServiceReply {
	int status{200};
	json body;
};

using IdSource = std::function<std::string()>;

int httpStatusFor(quiz::FailureKind failure);

// Reads {text, counts{...}, difficulty}. Count keys accept the item type aliases.
bool parseRequestSpec(const json &body, quiz::RequestSpec &spec, std::string &error,
					  int maxPerType = quiz::kMaxItemsPerType);

// Transport-free request handling behind the HTTP routes.
class QuizService {
public:
	QuizService(std::shared_ptr<quiz::QuizGenerator> generator,
				std::shared_ptr<grading::Grader> grader,
				std::shared_ptr<answers::AnswerKeyStore> answers,
				std::shared_ptr<budget::BudgetTracker> budget,
				std::shared_ptr<budget::CooldownRegistry> cooldowns,
				IdSource nextId);

	ServiceReply generateQuiz(const json &body);
	ServiceReply grade(const json &body);
	json budgetStatus();

private:
	std::shared_ptr<quiz::QuizGenerator> generator_;
	std::shared_ptr<grading::Grader> grader_;
	std::shared_ptr<answers::AnswerKeyStore> answers_;
	std::shared_ptr<budget::BudgetTracker> budget_;
	std::shared_ptr<budget::CooldownRegistry> cooldowns_;
	IdSource nextId_;
};

} // namespace service

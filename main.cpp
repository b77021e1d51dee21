#include <curl/curl.h>
#include <drogon/utils/Utilities.h>

#include <iostream>
#include <memory>

#include "answer_store.hpp"
#include "budget.hpp"
#include "config.hpp"
#include "dispatch.hpp"
#include "gateway.hpp"
#include "generator.hpp"
#include "grading.hpp"
#include "provider.hpp"
#include "quiz_service.hpp"

int main(int argc, char **argv) {
	const auto cfg = config::loadConfig(argc, argv);

	if (cfg.apiKey.empty()) {
		std::cerr << "[Bootstrap] QUIZ_API_KEY / GROQ_API_KEY is not set; provider calls will be rejected" << std::endl;
	}
	if (cfg.authEnabled && cfg.jwtSecret == "dev-secret-change-me") {
		std::cerr << "[Bootstrap] using the development JWT secret" << std::endl;
	}

	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		std::cerr << "[Bootstrap] curl_global_init failed" << std::endl;
		return 1;
	}

	auto clock = std::make_shared<budget::SystemClock>();
	auto tracker = std::make_shared<budget::BudgetTracker>(cfg.limits, clock);
	auto cooldowns = std::make_shared<budget::CooldownRegistry>(clock);
	auto client = std::make_shared<provider::CurlCompletionClient>(cfg.endpoint, cfg.apiKey, cfg.timeoutMs);
	auto dispatcher = std::make_shared<dispatch::Dispatcher>(config::dispatchConfig(cfg), tracker, cooldowns, client,
															 std::make_shared<dispatch::ThreadSleeper>());
	auto generator = std::make_shared<quiz::QuizGenerator>(dispatcher, config::generatorConfig(cfg));
	auto grader = std::make_shared<grading::Grader>(dispatcher);

	std::shared_ptr<answers::AnswerKeyStore> store;
	try {
		store = std::make_shared<answers::JsonFileAnswerStore>(cfg.answerStorePath);
	} catch (const std::exception &e) {
		std::cerr << "[Bootstrap] answer store at " << cfg.answerStorePath.string() << " unavailable (" << e.what()
				  << "); keeping answer keys in memory" << std::endl;
		store = std::make_shared<answers::MemoryAnswerStore>();
	}

	auto svc = std::make_shared<service::QuizService>(generator, grader, store, tracker, cooldowns,
													  []() { return drogon::utils::getUuid(); });

	std::cout << "[Bootstrap] models:";
	for (const auto &m : cfg.models) std::cout << " " << m;
	std::cout << " | rpm=" << cfg.limits.rpm << " rpd=" << cfg.limits.rpd << " tpm=" << cfg.limits.tpm
			  << " tpd=" << cfg.limits.tpd << std::endl;

	int rc = 0;
	try {
		gateway::GatewayServer server(cfg, svc);
		server.listen();
	} catch (const std::exception &e) {
		std::cerr << "[Bootstrap] gateway stopped: " << e.what() << std::endl;
		rc = 1;
	}
	curl_global_cleanup();
	return rc;
}

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "budget.hpp"
#include "dispatch.hpp"
#include "generator.hpp"

namespace config {

namespace fs = std::filesystem;

using ArgMap = std::map<std::string, std::string>;
using EnvLookup = std::function<std::string(const std::string &)>;

struct Config {
	std::string host{"127.0.0.1"};
	int port{5090};
	std::string apiKey;
	std::string endpoint{"https://api.groq.com/openai/v1/chat/completions"};
	std::vector<std::string> models{"llama-3.3-70b-versatile", "llama-3.1-8b-instant"};
	budget::BudgetLimits limits;
	int outputTokenCap{4096};
	int timeoutMs{75000};
	std::vector<std::chrono::milliseconds> retryBackoffs{std::chrono::milliseconds(300), std::chrono::milliseconds(600)};
	std::chrono::seconds shortCooldown{60};
	std::chrono::seconds longCooldown{21600};
	double temperature{0.3};
	std::vector<std::string> stopSequences{"```", "<think>"};
	std::size_t maxSourceChars{20000};
	int maxItemsPerType{quiz::kMaxItemsPerType};
	int workers{1};
	fs::path answerStorePath{"./runtime_store/answer_keys.json"};
	bool authEnabled{true};
	std::string jwtSecret{"dev-secret-change-me"};
};

std::string getEnv(const std::string &key, const std::string &fallback = "");
bool boolFrom(const std::string &value, bool fallback = true);
// fallback when s is empty, not a number, or not finite. 0 is a valid value.
double numberOr(const std::string &s, double fallback);
// numberOr clamped to [lo, hi], so integer casts of the result stay in range.
double numberIn(const std::string &s, double fallback, double lo, double hi);
std::vector<std::string> splitList(const std::string &s, char sep = ',');
ArgMap parseArgs(int argc, char **argv);

Config loadConfig(const ArgMap &args, const EnvLookup &env);
Config loadConfig(int argc, char **argv);

dispatch::DispatchConfig dispatchConfig(const Config &c);
quiz::GeneratorConfig generatorConfig(const Config &c);

} // namespace config

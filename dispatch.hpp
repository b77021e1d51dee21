#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "budget.hpp"
#include "provider.hpp"

namespace dispatch {

class Sleeper {
public:
	virtual ~Sleeper() = default;
	virtual void sleepFor(std::chrono::milliseconds d) = 0;
};

// Blocks only the calling request's thread.
class ThreadSleeper : public Sleeper {
public:
	void sleepFor(std::chrono::milliseconds d) override;
};

enum class ProviderErrorKind { Decommissioned, RateLimited, Transient, Unknown };

struct ProviderError {
	ProviderErrorKind kind{ProviderErrorKind::Unknown};
	bool longCooldown{false};
};

std::string toString(ProviderErrorKind kind);

// Classifies a non-200 reply. status 0 means the transport failed before any HTTP status.
ProviderError classifyFailure(long status, const std::string &body);
bool isLongCooldownMessage(const std::string &text);

// Pulls choices[0].message.content (or choices[0].text) and usage.total_tokens out of a 200 body.
bool parseCompletion(const std::string &body, std::string &content, int64_t &totalTokens);

std::vector<std::string> dedupeModels(const std::vector<std::string> &models);

struct DispatchConfig {
	std::vector<std::string> models;
	double temperature{0.3};
	std::vector<std::string> stop;
	std::vector<std::chrono::milliseconds> retryBackoffs{std::chrono::milliseconds(300), std::chrono::milliseconds(600)};
	std::chrono::seconds shortCooldown{60};
	std::chrono::seconds longCooldown{6 * 60 * 60};
	double reserveOutputFraction{budget::kReserveOutputFraction};
};

struct CallOptions {
	std::optional<double> temperature;
	std::optional<std::vector<std::string>> stop;
};

struct DispatchResult {
	std::string content;
	std::string model;
	int64_t totalTokens{0};
	int attempts{0};
};

// No model was eligible (cooldown or budget) before any call was made.
class BudgetExhausted : public std::runtime_error {
public:
	explicit BudgetExhausted(const std::string &what) : std::runtime_error(what) {}
};

// Every candidate was tried and none produced a usable 200.
class DispatchFailure : public std::runtime_error {
public:
	DispatchFailure(long status, std::string body);
	long status() const { return status_; }
	const std::string &body() const { return body_; }

private:
	long status_{0};
	std::string body_;
};

class Dispatcher {
public:
	Dispatcher(DispatchConfig config,
			   std::shared_ptr<budget::BudgetTracker> budget,
			   std::shared_ptr<budget::CooldownRegistry> cooldowns,
			   std::shared_ptr<provider::CompletionClient> client,
			   std::shared_ptr<Sleeper> sleeper);

	DispatchResult dispatch(const std::string &prompt, int outputCap, const CallOptions &opts = {});

	const DispatchConfig &config() const { return config_; }

private:
	enum class State { Selecting, Calling, Retrying, CoolingDown, Success, NextCandidate, Exhausted };

	std::vector<std::string> buildCandidates(int64_t estimate) const;
	bool eligible(const std::string &model, int64_t estimate) const;

	DispatchConfig config_;
	std::shared_ptr<budget::BudgetTracker> budget_;
	std::shared_ptr<budget::CooldownRegistry> cooldowns_;
	std::shared_ptr<provider::CompletionClient> client_;
	std::shared_ptr<Sleeper> sleeper_;
};

} // namespace dispatch

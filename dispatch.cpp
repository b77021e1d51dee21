#include "dispatch.hpp"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <thread>
#include <unordered_set>

#include "text_util.hpp"

namespace dispatch {

using textutil::lowerAscii;

namespace {

bool containsAny(const std::string &text, std::initializer_list<const char *> needles) {
	for (const char *n : needles) {
		if (text.find(n) != std::string::npos) return true;
	}
	return false;
}

std::string shorten(const std::string &s, size_t max = 400) {
	if (s.size() <= max) return s;
	return textutil::truncateUtf8(s, max) + "...";
}

} // namespace

void ThreadSleeper::sleepFor(std::chrono::milliseconds d) {
	std::this_thread::sleep_for(d);
}

std::string toString(ProviderErrorKind kind) {
	switch (kind) {
	case ProviderErrorKind::Decommissioned: return "decommissioned";
	case ProviderErrorKind::RateLimited: return "rate_limited";
	case ProviderErrorKind::Transient: return "transient";
	case ProviderErrorKind::Unknown: return "unknown";
	}
	return "unknown";
}

bool isLongCooldownMessage(const std::string &text) {
	std::string t = lowerAscii(text);
	if (containsAny(t, {"per day", "daily", "rpd", "tpd", "quota", "insufficient"})) return true;
	if (containsAny(t, {"per minute", "rpm", "tpm", "rate"})) return false;
	return t.find("exceeded") != std::string::npos;
}

ProviderError classifyFailure(long status, const std::string &body) {
	std::string code;
	std::string message;
	auto parsed = provider::json::parse(body, nullptr, false);
	if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
		const auto &err = parsed["error"];
		if (err.is_object()) {
			if (err.contains("code") && !err["code"].is_null()) {
				code = err["code"].is_string() ? err["code"].get<std::string>() : err["code"].dump();
			}
			if (err.contains("message") && err["message"].is_string()) message = err["message"].get<std::string>();
		} else if (err.is_string()) {
			message = err.get<std::string>();
		}
	} else {
		message = body;
	}
	code = lowerAscii(code);
	message = lowerAscii(message);
	const std::string text = code + " " + message;

	if (status == 400 || status == 404) {
		bool gone = containsAny(code, {"model_decommissioned", "model_not_found"}) ||
					message.find("decommissioned") != std::string::npos ||
					(message.find("model") != std::string::npos &&
					 containsAny(message, {"not found", "does not exist"}));
		if (gone) return {ProviderErrorKind::Decommissioned, false};
	}
	bool rateSignal = status == 429 || status == 403 ||
					  containsAny(text, {"rate limit", "rate_limit", "quota", "too many requests"});
	if (rateSignal) return {ProviderErrorKind::RateLimited, isLongCooldownMessage(text)};
	if (status == 500 || status == 502 || status == 503) return {ProviderErrorKind::Transient, false};
	return {ProviderErrorKind::Unknown, false};
}

bool parseCompletion(const std::string &body, std::string &content, int64_t &totalTokens) {
	auto j = provider::json::parse(body, nullptr, false);
	if (j.is_discarded() || !j.is_object()) return false;
	if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) return false;
	const auto &first = j["choices"][0];
	if (!first.is_object()) return false;
	if (first.contains("message") && first["message"].is_object() &&
		first["message"].contains("content") && first["message"]["content"].is_string()) {
		content = first["message"]["content"].get<std::string>();
	} else if (first.contains("text") && first["text"].is_string()) {
		content = first["text"].get<std::string>();
	} else {
		return false;
	}
	if (j.contains("usage") && j["usage"].is_object()) {
		const auto &usage = j["usage"];
		if (usage.contains("total_tokens") && usage["total_tokens"].is_number_integer()) {
			totalTokens = usage["total_tokens"].get<int64_t>();
		} else if (usage.contains("totalTokens") && usage["totalTokens"].is_number_integer()) {
			totalTokens = usage["totalTokens"].get<int64_t>();
		}
	}
	return true;
}

std::vector<std::string> dedupeModels(const std::vector<std::string> &models) {
	std::vector<std::string> out;
	std::unordered_set<std::string> seen;
	for (const auto &m : models) {
		std::string t = textutil::trimCopy(m);
		if (t.empty() || seen.count(t)) continue;
		seen.insert(t);
		out.push_back(t);
	}
	return out;
}

DispatchFailure::DispatchFailure(long status, std::string body)
	: std::runtime_error("provider dispatch failed (last status " + std::to_string(status) + "): " + shorten(body)),
	  status_(status), body_(std::move(body)) {}

Dispatcher::Dispatcher(DispatchConfig config,
					   std::shared_ptr<budget::BudgetTracker> budget,
					   std::shared_ptr<budget::CooldownRegistry> cooldowns,
					   std::shared_ptr<provider::CompletionClient> client,
					   std::shared_ptr<Sleeper> sleeper)
	: config_(std::move(config)), budget_(std::move(budget)), cooldowns_(std::move(cooldowns)),
	  client_(std::move(client)), sleeper_(std::move(sleeper)) {
	config_.models = dedupeModels(config_.models);
}

bool Dispatcher::eligible(const std::string &model, int64_t estimate) const {
	if (cooldowns_->isOnCooldown(model)) return false;
	return budget_->canAfford(estimate).ok;
}

std::vector<std::string> Dispatcher::buildCandidates(int64_t estimate) const {
	std::vector<std::string> out;
	auto first = std::find_if(config_.models.begin(), config_.models.end(),
							  [&](const std::string &m) { return eligible(m, estimate); });
	if (first == config_.models.end()) return out;
	out.push_back(*first);
	for (const auto &m : config_.models) {
		if (m != *first) out.push_back(m);
	}
	return out;
}

DispatchResult Dispatcher::dispatch(const std::string &prompt, int outputCap, const CallOptions &opts) {
	const int64_t estimate = budget::estimateTokens(prompt.size(), outputCap, config_.reserveOutputFraction);
	const int64_t promptOnly = budget::promptTokens(prompt.size());

	auto candidates = buildCandidates(estimate);
	if (candidates.empty()) {
		auto afford = budget_->canAfford(estimate);
		std::string why = afford.ok ? "all models cooling down" : ("over " + afford.reason + " budget");
		std::cerr << "[Dispatch] no eligible model: " << why << std::endl;
		throw BudgetExhausted("no eligible model: " + why);
	}

	provider::CompletionRequest req;
	req.prompt = prompt;
	req.maxTokens = outputCap;
	req.temperature = opts.temperature.value_or(config_.temperature);
	req.stop = opts.stop.value_or(config_.stop);

	DispatchResult result;
	ProviderError lastError;
	long lastStatus = 0;
	std::string lastBody;
	bool called = false;
	size_t idx = 0;
	size_t retries = 0;
	std::string model;
	State state = State::Selecting;

	while (true) {
		switch (state) {
		case State::Selecting:
			if (idx >= candidates.size()) {
				state = State::Exhausted;
				break;
			}
			model = candidates[idx];
			retries = 0;
			if (cooldowns_->isOnCooldown(model)) {
				std::cout << "[Dispatch] skip " << model << ": cooling down" << std::endl;
				state = State::NextCandidate;
				break;
			}
			state = State::Calling;
			break;

		case State::Calling: {
			std::string reason;
			if (!budget_->tryReserve(estimate, &reason)) {
				std::cout << "[Dispatch] skip " << model << ": over " << reason << " budget" << std::endl;
				state = State::NextCandidate;
				break;
			}
			called = true;
			result.attempts++;
			req.model = model;
			auto reply = client_->complete(req);
			lastStatus = reply.status;
			lastBody = reply.status != 0 ? reply.body : reply.transportError;

			if (reply.status == 200) {
				std::string content;
				int64_t used = estimate;
				if (parseCompletion(reply.body, content, used)) {
					budget_->adjustAfterResponse(estimate, used);
					result.content = std::move(content);
					result.model = model;
					result.totalTokens = used;
					state = State::Success;
					break;
				}
				budget_->adjustAfterResponse(estimate, promptOnly);
				std::cerr << "[Dispatch] " << model << " returned 200 without content: " << shorten(reply.body) << std::endl;
				state = State::NextCandidate;
				break;
			}

			budget_->adjustAfterResponse(estimate, promptOnly);
			lastError = classifyFailure(reply.status, reply.body);
			std::cerr << "[Dispatch] " << model << " status " << reply.status << " ("
					  << toString(lastError.kind) << "): " << shorten(lastBody) << std::endl;
			switch (lastError.kind) {
			case ProviderErrorKind::RateLimited: state = State::CoolingDown; break;
			case ProviderErrorKind::Transient: state = State::Retrying; break;
			case ProviderErrorKind::Decommissioned:
			case ProviderErrorKind::Unknown: state = State::NextCandidate; break;
			}
			break;
		}

		case State::Retrying:
			if (retries >= config_.retryBackoffs.size()) {
				std::cerr << "[Dispatch] " << model << " still failing after " << retries << " retries" << std::endl;
				state = State::NextCandidate;
				break;
			}
			sleeper_->sleepFor(config_.retryBackoffs[retries]);
			retries++;
			state = State::Calling;
			break;

		case State::CoolingDown:
			cooldowns_->setCooldown(model, lastError.longCooldown ? config_.longCooldown : config_.shortCooldown);
			state = State::NextCandidate;
			break;

		case State::NextCandidate:
			idx++;
			state = State::Selecting;
			break;

		case State::Success:
			return result;

		case State::Exhausted:
			if (!called) throw BudgetExhausted("no eligible model: every candidate was cooling down or over budget");
			throw DispatchFailure(lastStatus, lastBody);
		}
	}
}

} // namespace dispatch

#include "budget.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace budget {

namespace {

int64_t epochSeconds(TimePoint t) {
	return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

int64_t floorDiv(int64_t a, int64_t b) {
	int64_t q = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
	return q;
}

bool exceeds(int64_t used, int64_t add, int64_t limit) {
	return limit > 0 && used + add > limit;
}

} // namespace

int64_t promptTokens(std::size_t promptLength) {
	return static_cast<int64_t>((promptLength + 3) / 4);
}

int64_t estimateTokens(std::size_t promptLength, int outputCap, double outputFraction) {
	double out = std::ceil(std::max(0, outputCap) * outputFraction);
	return promptTokens(promptLength) + static_cast<int64_t>(out);
}

BudgetTracker::BudgetTracker(BudgetLimits limits, std::shared_ptr<Clock> clock)
	: clock_(std::move(clock)) {
	state_.limits = limits;
	int64_t secs = epochSeconds(clock_->now());
	state_.minuteEpoch = floorDiv(secs, 60);
	state_.dayEpoch = floorDiv(secs, 86400);
}

void BudgetTracker::rolloverLocked() {
	int64_t secs = epochSeconds(clock_->now());
	int64_t minute = floorDiv(secs, 60);
	int64_t day = floorDiv(secs, 86400);
	if (minute != state_.minuteEpoch) {
		state_.minuteEpoch = minute;
		state_.requestsThisMinute = 0;
		state_.tokensThisMinute = 0;
	}
	if (day != state_.dayEpoch) {
		state_.dayEpoch = day;
		state_.requestsToday = 0;
		state_.tokensToday = 0;
	}
}

Affordability BudgetTracker::checkLocked(int64_t tokenEstimate) const {
	const auto &l = state_.limits;
	if (exceeds(state_.requestsThisMinute, 1, l.rpm)) return {false, "rpm"};
	if (exceeds(state_.requestsToday, 1, l.rpd)) return {false, "rpd"};
	if (exceeds(state_.tokensThisMinute, tokenEstimate, l.tpm)) return {false, "tpm"};
	if (exceeds(state_.tokensToday, tokenEstimate, l.tpd)) return {false, "tpd"};
	return {};
}

void BudgetTracker::reserveLocked(int64_t tokenEstimate) {
	int64_t tokens = std::max<int64_t>(0, tokenEstimate);
	state_.requestsThisMinute++;
	state_.requestsToday++;
	state_.tokensThisMinute += tokens;
	state_.tokensToday += tokens;
}

Affordability BudgetTracker::canAfford(int64_t tokenEstimate) {
	std::lock_guard<std::mutex> lock(mu_);
	rolloverLocked();
	return checkLocked(tokenEstimate);
}

void BudgetTracker::reserve(int64_t tokenEstimate) {
	std::lock_guard<std::mutex> lock(mu_);
	rolloverLocked();
	reserveLocked(tokenEstimate);
}

bool BudgetTracker::tryReserve(int64_t tokenEstimate, std::string *reason) {
	std::lock_guard<std::mutex> lock(mu_);
	rolloverLocked();
	auto check = checkLocked(tokenEstimate);
	if (!check.ok) {
		if (reason) *reason = check.reason;
		return false;
	}
	reserveLocked(tokenEstimate);
	return true;
}

void BudgetTracker::adjustAfterResponse(int64_t reserved, int64_t actual) {
	std::lock_guard<std::mutex> lock(mu_);
	rolloverLocked();
	int64_t delta = actual - reserved;
	state_.tokensThisMinute = std::max<int64_t>(0, state_.tokensThisMinute + delta);
	state_.tokensToday = std::max<int64_t>(0, state_.tokensToday + delta);
}

BudgetState BudgetTracker::snapshot() {
	std::lock_guard<std::mutex> lock(mu_);
	rolloverLocked();
	return state_;
}

CooldownRegistry::CooldownRegistry(std::shared_ptr<Clock> clock)
	: clock_(std::move(clock)) {}

bool CooldownRegistry::isOnCooldown(const std::string &model) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = expiries_.find(model);
	if (it == expiries_.end()) return false;
	return clock_->now() < it->second;
}

void CooldownRegistry::setCooldown(const std::string &model, std::chrono::seconds duration) {
	std::lock_guard<std::mutex> lock(mu_);
	TimePoint until = clock_->now() + duration;
	auto it = expiries_.find(model);
	if (it == expiries_.end()) {
		expiries_[model] = until;
	} else if (until > it->second) {
		it->second = until;
	}
	std::cout << "[Budget] cooldown " << model << " for " << duration.count() << "s" << std::endl;
}

std::optional<TimePoint> CooldownRegistry::expiryOf(const std::string &model) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = expiries_.find(model);
	if (it == expiries_.end()) return std::nullopt;
	return it->second;
}

std::map<std::string, TimePoint> CooldownRegistry::active() const {
	std::lock_guard<std::mutex> lock(mu_);
	std::map<std::string, TimePoint> out;
	auto now = clock_->now();
	for (const auto &kv : expiries_) {
		if (now < kv.second) out.insert(kv);
	}
	return out;
}

} // namespace budget

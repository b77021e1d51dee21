#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace budget {

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
public:
	virtual ~Clock() = default;
	virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
	TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// A ceiling of 0 disables that counter.
struct BudgetLimits {
	int64_t rpm{30};
	int64_t rpd{1000};
	int64_t tpm{12000};
	int64_t tpd{100000};
};

struct BudgetState {
	int64_t requestsThisMinute{0};
	int64_t requestsToday{0};
	int64_t tokensThisMinute{0};
	int64_t tokensToday{0};
	BudgetLimits limits;
	int64_t minuteEpoch{0};
	int64_t dayEpoch{0};
};

struct Affordability {
	bool ok{true};
	std::string reason;
};

// Share of the output cap reserved up front for an in-flight call.
constexpr double kReserveOutputFraction = 0.5;

int64_t promptTokens(std::size_t promptLength);
int64_t estimateTokens(std::size_t promptLength, int outputCap, double outputFraction = kReserveOutputFraction);

// Rolling per-minute / per-day request and token counters. Windows roll over lazily on every call.
// One instance is shared by every request in the process; all operations take mu_.
class BudgetTracker {
public:
	BudgetTracker(BudgetLimits limits, std::shared_ptr<Clock> clock);

	Affordability canAfford(int64_t tokenEstimate);
	void reserve(int64_t tokenEstimate);
	// canAfford + reserve under a single lock, so two callers cannot both pass the check.
	bool tryReserve(int64_t tokenEstimate, std::string *reason = nullptr);
	void adjustAfterResponse(int64_t reserved, int64_t actual);

	BudgetState snapshot();

private:
	void rolloverLocked();
	Affordability checkLocked(int64_t tokenEstimate) const;
	void reserveLocked(int64_t tokenEstimate);

	std::shared_ptr<Clock> clock_;
	mutable std::mutex mu_;
	BudgetState state_;
};

class CooldownRegistry {
public:
	explicit CooldownRegistry(std::shared_ptr<Clock> clock);

	bool isOnCooldown(const std::string &model) const;
	// Max-merge: an earlier expiry never replaces a later one.
	void setCooldown(const std::string &model, std::chrono::seconds duration);
	std::optional<TimePoint> expiryOf(const std::string &model) const;
	std::map<std::string, TimePoint> active() const;

private:
	std::shared_ptr<Clock> clock_;
	mutable std::mutex mu_;
	std::map<std::string, TimePoint> expiries_;
};

} // namespace budget

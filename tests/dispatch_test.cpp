#include <gtest/gtest.h>

#include "dispatch.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;
using testing_fakes::DispatchRig;

namespace {

const std::string kPrompt(400, 'x'); // 100 prompt tokens

} // namespace

TEST(Dispatcher, ReturnsContentAndChargesRealUsage) {
	DispatchRig rig;
	rig.client->pushContent("[]", 321);
	auto res = rig.dispatcher->dispatch(kPrompt, 1000);
	EXPECT_EQ(res.content, "[]");
	EXPECT_EQ(res.model, "primary");
	EXPECT_EQ(res.totalTokens, 321);
	EXPECT_EQ(res.attempts, 1);
	auto s = rig.tracker->snapshot();
	EXPECT_EQ(s.tokensThisMinute, 321);
	EXPECT_EQ(s.requestsThisMinute, 1);
}

TEST(Dispatcher, RequestCarriesConfiguredParameters) {
	DispatchRig rig;
	rig.client->pushContent("ok");
	rig.dispatcher->dispatch(kPrompt, 777);
	ASSERT_EQ(rig.client->requests.size(), 1u);
	const auto &req = rig.client->requests[0];
	EXPECT_EQ(req.prompt, kPrompt);
	EXPECT_EQ(req.maxTokens, 777);
	EXPECT_DOUBLE_EQ(req.temperature, 0.3);
	EXPECT_EQ(req.stop, (std::vector<std::string>{"```", "<think>"}));

	rig.client->pushContent("TRUE");
	dispatch::CallOptions opts;
	opts.temperature = 0.0;
	opts.stop = std::vector<std::string>{};
	rig.dispatcher->dispatch(kPrompt, 5, opts);
	EXPECT_DOUBLE_EQ(rig.client->requests[1].temperature, 0.0);
	EXPECT_TRUE(rig.client->requests[1].stop.empty());
}

TEST(Dispatcher, DecommissionedModelMovesOnWithoutRetryOrCooldown) {
	DispatchRig rig;
	rig.client->pushError(400, "model_decommissioned", "The model `primary` has been decommissioned");
	rig.client->pushContent("[1]", 200);
	auto res = rig.dispatcher->dispatch(kPrompt, 1000);
	EXPECT_EQ(res.model, "secondary");
	EXPECT_EQ(rig.client->models(), (std::vector<std::string>{"primary", "secondary"}));
	EXPECT_TRUE(rig.sleeper->sleeps.empty());
	EXPECT_FALSE(rig.cooldowns->isOnCooldown("primary"));
	// the failed call is charged its prompt tokens only
	EXPECT_EQ(rig.tracker->snapshot().tokensThisMinute, 100 + 200);
}

TEST(Dispatcher, MinuteRateLimitGetsShortCooldown) {
	DispatchRig rig;
	rig.client->pushError(429, "rate_limit_exceeded", "Rate limit reached: Limit 30, Used 30 requests per minute (RPM)");
	rig.client->pushContent("[]");
	auto start = rig.clock->now();
	auto res = rig.dispatcher->dispatch(kPrompt, 1000);
	EXPECT_EQ(res.model, "secondary");
	ASSERT_TRUE(rig.cooldowns->expiryOf("primary").has_value());
	EXPECT_EQ(*rig.cooldowns->expiryOf("primary"), start + 60s);
	EXPECT_TRUE(rig.sleeper->sleeps.empty());
}

TEST(Dispatcher, DailyQuotaGetsLongCooldown) {
	DispatchRig rig;
	rig.client->pushError(429, "rate_limit_exceeded", "Rate limit reached on tokens per day (TPD): Limit 100000");
	rig.client->pushContent("[]");
	auto start = rig.clock->now();
	rig.dispatcher->dispatch(kPrompt, 1000);
	EXPECT_EQ(*rig.cooldowns->expiryOf("primary"), start + 6h);
}

TEST(Dispatcher, CooledModelIsSkippedOnLaterRequests) {
	DispatchRig rig;
	rig.cooldowns->setCooldown("primary", 60s);
	rig.client->pushContent("a");
	rig.client->pushContent("b");
	EXPECT_EQ(rig.dispatcher->dispatch(kPrompt, 100).model, "secondary");
	EXPECT_EQ(rig.dispatcher->dispatch(kPrompt, 100).model, "secondary");
	EXPECT_EQ(rig.client->models(), (std::vector<std::string>{"secondary", "secondary"}));

	rig.clock->advance(61s);
	rig.client->pushContent("c");
	EXPECT_EQ(rig.dispatcher->dispatch(kPrompt, 100).model, "primary");
}

TEST(Dispatcher, TransientErrorsRetryWithBackoff) {
	DispatchRig rig;
	rig.client->push(503, R"({"error":{"message":"Service Unavailable"}})");
	rig.client->push(502, "Bad Gateway");
	rig.client->pushContent("done");
	auto res = rig.dispatcher->dispatch(kPrompt, 100);
	EXPECT_EQ(res.content, "done");
	EXPECT_EQ(res.model, "primary");
	EXPECT_EQ(res.attempts, 3);
	EXPECT_EQ(rig.sleeper->sleeps, (std::vector<std::chrono::milliseconds>{300ms, 600ms}));
}

TEST(Dispatcher, PersistentTransientErrorFallsThroughToNextModel) {
	DispatchRig rig;
	rig.client->push(500, "oops");
	rig.client->push(500, "oops");
	rig.client->push(500, "oops");
	rig.client->pushContent("fallback");
	auto res = rig.dispatcher->dispatch(kPrompt, 100);
	EXPECT_EQ(res.model, "secondary");
	EXPECT_EQ(rig.client->models(), (std::vector<std::string>{"primary", "primary", "primary", "secondary"}));
	EXPECT_EQ(rig.sleeper->sleeps.size(), 2u);
}

TEST(Dispatcher, TransportFailureMovesToNextModel) {
	DispatchRig rig;
	rig.client->pushTransportError("Timeout was reached");
	rig.client->pushContent("ok");
	auto res = rig.dispatcher->dispatch(kPrompt, 100);
	EXPECT_EQ(res.model, "secondary");
	EXPECT_TRUE(rig.sleeper->sleeps.empty());
}

TEST(Dispatcher, EveryCandidateFailingRaisesDispatchFailure) {
	DispatchRig rig;
	rig.client->pushError(401, "invalid_api_key", "Invalid API Key");
	rig.client->pushError(401, "invalid_api_key", "Invalid API Key");
	try {
		rig.dispatcher->dispatch(kPrompt, 100);
		FAIL() << "expected DispatchFailure";
	} catch (const dispatch::DispatchFailure &e) {
		EXPECT_EQ(e.status(), 401);
		EXPECT_NE(e.body().find("Invalid API Key"), std::string::npos);
	}
	EXPECT_EQ(rig.client->requests.size(), 2u);
}

TEST(Dispatcher, AllModelsCoolingDownRaisesBudgetExhaustedWithoutCalling) {
	DispatchRig rig;
	rig.cooldowns->setCooldown("primary", 60s);
	rig.cooldowns->setCooldown("secondary", 60s);
	EXPECT_THROW(rig.dispatcher->dispatch(kPrompt, 100), dispatch::BudgetExhausted);
	EXPECT_TRUE(rig.client->requests.empty());
}

TEST(Dispatcher, OverBudgetRaisesBudgetExhaustedWithoutCalling) {
	DispatchRig rig({"primary", "secondary"}, budget::BudgetLimits{30, 1000, 500, 100000});
	EXPECT_THROW(rig.dispatcher->dispatch(kPrompt, 1000), dispatch::BudgetExhausted);
	EXPECT_TRUE(rig.client->requests.empty());
	EXPECT_EQ(rig.tracker->snapshot().requestsThisMinute, 0);
}

TEST(Dispatcher, DuplicateModelsAreTriedOnce) {
	DispatchRig rig({"primary", "primary", "secondary"});
	rig.client->pushError(404, "model_not_found", "The model `primary` does not exist");
	rig.client->pushError(404, "model_not_found", "The model `secondary` does not exist");
	EXPECT_THROW(rig.dispatcher->dispatch(kPrompt, 100), dispatch::DispatchFailure);
	EXPECT_EQ(rig.client->models(), (std::vector<std::string>{"primary", "secondary"}));
}

TEST(ClassifyFailure, RecognisesProviderSignatures) {
	using dispatch::ProviderErrorKind;
	EXPECT_EQ(dispatch::classifyFailure(400, R"({"error":{"code":"model_decommissioned","message":"gone"}})").kind,
			  ProviderErrorKind::Decommissioned);
	EXPECT_EQ(dispatch::classifyFailure(404, R"({"error":{"message":"The model `x` does not exist"}})").kind,
			  ProviderErrorKind::Decommissioned);
	EXPECT_EQ(dispatch::classifyFailure(400, R"({"error":{"message":"max_tokens too large"}})").kind,
			  ProviderErrorKind::Unknown);
	EXPECT_EQ(dispatch::classifyFailure(429, "{}").kind, ProviderErrorKind::RateLimited);
	EXPECT_EQ(dispatch::classifyFailure(403, "forbidden").kind, ProviderErrorKind::RateLimited);
	EXPECT_EQ(dispatch::classifyFailure(400, R"({"error":{"message":"You exceeded your current quota"}})").kind,
			  ProviderErrorKind::RateLimited);
	EXPECT_EQ(dispatch::classifyFailure(503, "").kind, ProviderErrorKind::Transient);
	EXPECT_EQ(dispatch::classifyFailure(401, "").kind, ProviderErrorKind::Unknown);
	EXPECT_EQ(dispatch::classifyFailure(0, "").kind, ProviderErrorKind::Unknown);
}

TEST(ClassifyFailure, CooldownLengthFollowsMessage) {
	EXPECT_TRUE(dispatch::isLongCooldownMessage("Limit 14400, Used 14400 requests per day (RPD)"));
	EXPECT_TRUE(dispatch::isLongCooldownMessage("insufficient_quota"));
	EXPECT_FALSE(dispatch::isLongCooldownMessage("Used 6000 tokens per minute (TPM). Please try again in 2s"));
	EXPECT_FALSE(dispatch::isLongCooldownMessage("Rate limit reached"));
	EXPECT_TRUE(dispatch::isLongCooldownMessage("limit exceeded"));
	EXPECT_FALSE(dispatch::isLongCooldownMessage(""));
}

TEST(ParseCompletion, ReadsContentAndUsage) {
	std::string content;
	int64_t tokens = -1;
	EXPECT_TRUE(dispatch::parseCompletion(
		R"({"choices":[{"message":{"content":"hi"}}],"usage":{"total_tokens":42}})", content, tokens));
	EXPECT_EQ(content, "hi");
	EXPECT_EQ(tokens, 42);

	tokens = 7;
	EXPECT_TRUE(dispatch::parseCompletion(R"({"choices":[{"text":"legacy"}]})", content, tokens));
	EXPECT_EQ(content, "legacy");
	EXPECT_EQ(tokens, 7);

	EXPECT_FALSE(dispatch::parseCompletion(R"({"choices":[]})", content, tokens));
	EXPECT_FALSE(dispatch::parseCompletion("not json", content, tokens));
}

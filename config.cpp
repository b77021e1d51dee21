#include "config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <thread>

#include "text_util.hpp"

namespace config {

namespace {

constexpr double kMaxLimit = 1e12;
constexpr double kMaxBackoffMs = 600000;
constexpr double kMaxCooldownS = 30 * 86400;

} // namespace

std::string getEnv(const std::string &key, const std::string &fallback) {
	const char *v = std::getenv(key.c_str());
	if (!v) return fallback;
	return std::string(v);
}

bool boolFrom(const std::string &value, bool fallback) {
	std::string v = textutil::lowerAscii(textutil::trimCopy(value));
	if (v.empty()) return fallback;
	return !(v == "0" || v == "false" || v == "off" || v == "no");
}

double numberOr(const std::string &s, double fallback) {
	std::string t = textutil::trimCopy(s);
	if (t.empty()) return fallback;
	try {
		size_t idx = 0;
		double v = std::stod(t, &idx);
		if (idx != t.size() || !std::isfinite(v)) return fallback;
		return v;
	} catch (const std::invalid_argument &) {
		return fallback;
	} catch (const std::out_of_range &) {
		return fallback;
	}
}

double numberIn(const std::string &s, double fallback, double lo, double hi) {
	return std::clamp(numberOr(s, fallback), lo, hi);
}

std::vector<std::string> splitList(const std::string &s, char sep) {
	std::vector<std::string> out;
	size_t start = 0;
	while (start <= s.size()) {
		size_t pos = s.find(sep, start);
		if (pos == std::string::npos) pos = s.size();
		std::string item = textutil::trimCopy(s.substr(start, pos - start));
		if (!item.empty()) out.push_back(item);
		start = pos + 1;
	}
	return out;
}

ArgMap parseArgs(int argc, char **argv) {
	ArgMap out;
	for (int i = 1; i < argc; i++) {
		std::string item = argv[i];
		if (item.rfind("--", 0) != 0) continue;
		auto pos = item.find('=');
		if (pos == std::string::npos) {
			out[item.substr(2)] = "true";
		} else {
			out[item.substr(2, pos - 2)] = item.substr(pos + 1);
		}
	}
	return out;
}

Config loadConfig(const ArgMap &args, const EnvLookup &env) {
	auto argOrEnv = [&](const std::string &argKey, const std::string &envKey, const std::string &def = "") {
		auto it = args.find(argKey);
		if (it != args.end() && !it->second.empty()) return it->second;
		std::string v = env(envKey);
		if (!v.empty()) return v;
		return def;
	};
	auto count = [&](const std::string &argKey, const std::string &envKey, int64_t def, double hi) {
		return static_cast<int64_t>(numberIn(argOrEnv(argKey, envKey), static_cast<double>(def), 0.0, hi));
	};

	Config c;
	c.host = argOrEnv("host", "QUIZ_HOST", c.host);
	double port = numberOr(argOrEnv("port", "QUIZ_PORT"), c.port);
	if (port >= 1 && port <= 65535) c.port = static_cast<int>(port);
	c.apiKey = env("QUIZ_API_KEY");
	if (c.apiKey.empty()) c.apiKey = env("GROQ_API_KEY");
	c.endpoint = argOrEnv("endpoint", "QUIZ_ENDPOINT", c.endpoint);

	auto models = splitList(argOrEnv("models", "QUIZ_MODELS"));
	if (!models.empty()) c.models = dispatch::dedupeModels(models);

	c.limits.rpm = count("rpm", "QUIZ_RPM", c.limits.rpm, kMaxLimit);
	c.limits.rpd = count("rpd", "QUIZ_RPD", c.limits.rpd, kMaxLimit);
	c.limits.tpm = count("tpm", "QUIZ_TPM", c.limits.tpm, kMaxLimit);
	c.limits.tpd = count("tpd", "QUIZ_TPD", c.limits.tpd, kMaxLimit);

	c.outputTokenCap = static_cast<int>(numberIn(argOrEnv("max-tokens", "QUIZ_MAX_TOKENS"), c.outputTokenCap, 16, 1000000));
	c.timeoutMs = static_cast<int>(numberIn(argOrEnv("timeout-ms", "QUIZ_TIMEOUT_MS"), c.timeoutMs, 1000, 3600000));

	std::string backoffRaw = argOrEnv("retry-backoff-ms", "QUIZ_RETRY_BACKOFF_MS");
	if (!backoffRaw.empty()) {
		c.retryBackoffs.clear();
		for (const auto &item : splitList(backoffRaw)) {
			double ms = numberOr(item, -1);
			if (ms >= 0) c.retryBackoffs.emplace_back(static_cast<int64_t>(std::min(ms, kMaxBackoffMs)));
		}
	}

	c.shortCooldown = std::chrono::seconds(count("short-cooldown-s", "QUIZ_SHORT_COOLDOWN_S", c.shortCooldown.count(), kMaxCooldownS));
	c.longCooldown = std::chrono::seconds(count("long-cooldown-s", "QUIZ_LONG_COOLDOWN_S", c.longCooldown.count(), kMaxCooldownS));
	c.temperature = std::clamp(numberOr(argOrEnv("temperature", "QUIZ_TEMPERATURE"), c.temperature), 0.0, 2.0);

	std::string stopRaw = argOrEnv("stop", "QUIZ_STOP");
	if (!stopRaw.empty()) c.stopSequences = (stopRaw == "none") ? std::vector<std::string>{} : splitList(stopRaw);

	c.maxSourceChars = static_cast<std::size_t>(
		numberIn(argOrEnv("max-source-chars", "QUIZ_MAX_SOURCE_CHARS"), static_cast<double>(c.maxSourceChars), 256, 1e9));
	c.maxItemsPerType = static_cast<int>(
		numberIn(argOrEnv("max-items-per-type", "QUIZ_MAX_ITEMS_PER_TYPE"), c.maxItemsPerType, 1, 1000));

	int hw = static_cast<int>(std::thread::hardware_concurrency());
	int defaultWorkers = std::max(1, hw - 1);
	c.workers = static_cast<int>(numberIn(argOrEnv("workers", "QUIZ_WORKERS"), defaultWorkers, 1, 1024));

	c.answerStorePath = fs::path(argOrEnv("answers", "QUIZ_ANSWER_STORE", c.answerStorePath.string()));
	c.authEnabled = boolFrom(env("QUIZ_AUTH_ENABLED"), true);
	c.jwtSecret = env("QUIZ_AUTH_JWT_SECRET");
	if (c.jwtSecret.empty()) c.jwtSecret = "dev-secret-change-me";
	return c;
}

Config loadConfig(int argc, char **argv) {
	return loadConfig(parseArgs(argc, argv), [](const std::string &key) { return getEnv(key); });
}

dispatch::DispatchConfig dispatchConfig(const Config &c) {
	dispatch::DispatchConfig d;
	d.models = c.models;
	d.temperature = c.temperature;
	d.stop = c.stopSequences;
	d.retryBackoffs = c.retryBackoffs;
	d.shortCooldown = c.shortCooldown;
	d.longCooldown = c.longCooldown;
	return d;
}

quiz::GeneratorConfig generatorConfig(const Config &c) {
	quiz::GeneratorConfig g;
	g.outputTokenCap = c.outputTokenCap;
	g.maxSourceChars = c.maxSourceChars;
	g.maxItemsPerType = c.maxItemsPerType;
	return g;
}

} // namespace config

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace provider {

using json = nlohmann::json;

struct CompletionRequest {
	std::string model;
	std::string prompt;
	double temperature{0.3};
	int maxTokens{4096};
	std::vector<std::string> stop;
};

struct CompletionReply {
	long status{0};
	std::string body;
	std::string transportError;
};

// One blocking attempt against the completion endpoint; no retries at this level.
class CompletionClient {
public:
	virtual ~CompletionClient() = default;
	virtual CompletionReply complete(const CompletionRequest &req) = 0;
};

json buildRequestBody(const CompletionRequest &req);

class CurlCompletionClient : public CompletionClient {
public:
	CurlCompletionClient(std::string endpoint, std::string apiKey, int timeoutMs);
	CompletionReply complete(const CompletionRequest &req) override;

private:
	std::string endpoint_;
	std::string apiKey_;
	int timeoutMs_{75000};
};

} // namespace provider

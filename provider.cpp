#include "provider.hpp"

#include <curl/curl.h>

namespace provider {

namespace {

struct CurlWriteCtx {
	std::string *out;
	size_t maxBytes;
};

size_t curlWriteCb(char *ptr, size_t size, size_t nmemb, void *userdata) {
	auto *ctx = reinterpret_cast<CurlWriteCtx *>(userdata);
	size_t total = size * nmemb;
	if (ctx->maxBytes > 0 && ctx->out->size() + total > ctx->maxBytes) {
		size_t allowed = ctx->maxBytes - ctx->out->size();
		if (allowed > 0) ctx->out->append(ptr, allowed);
		return 0;
	}
	ctx->out->append(ptr, total);
	return total;
}

constexpr size_t kMaxReplyBytes = 4 * 1024 * 1024;

} // namespace

json buildRequestBody(const CompletionRequest &req) {
	json body{
		{"model", req.model},
		{"messages", json::array({json{{"role", "user"}, {"content", req.prompt}}})},
		{"temperature", req.temperature},
		{"max_tokens", req.maxTokens},
	};
	if (!req.stop.empty()) body["stop"] = req.stop;
	return body;
}

CurlCompletionClient::CurlCompletionClient(std::string endpoint, std::string apiKey, int timeoutMs)
	: endpoint_(std::move(endpoint)), apiKey_(std::move(apiKey)), timeoutMs_(timeoutMs) {}

CompletionReply CurlCompletionClient::complete(const CompletionRequest &req) {
	CompletionReply res;
	CURL *curl = curl_easy_init();
	if (!curl) {
		res.transportError = "curl_easy_init failed";
		return res;
	}
	const std::string payload = buildRequestBody(req).dump();
	const std::string auth = "Authorization: Bearer " + apiKey_;
	struct curl_slist *headers = nullptr;
	headers = curl_slist_append(headers, "Content-Type: application/json");
	headers = curl_slist_append(headers, auth.c_str());

	curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs_));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_USERAGENT, "quizforge/1.0");
	CurlWriteCtx ctx{&res.body, kMaxReplyBytes};
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCb);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

	CURLcode rc = curl_easy_perform(curl);
	if (rc != CURLE_OK) {
		res.transportError = curl_easy_strerror(rc);
	} else {
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
	}
	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);
	return res;
}

} // namespace provider

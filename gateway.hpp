#pragma once

#include <functional>
#include <memory>
#include <string>

#include <drogon/drogon.h>
#include <json/json.h>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "quiz_service.hpp"
#include "worker_pool.hpp"

namespace gateway {

using json = nlohmann::json;
using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

json fromJsoncpp(const Json::Value &v);
Json::Value toJsoncpp(const json &v);

class GatewayServer {
public:
	GatewayServer(config::Config config, std::shared_ptr<service::QuizService> service);

	void listen();

private:
	struct AuthError {
		std::string error;
		std::string message;
	};

	void setupRoutes();
	bool authOK(const drogon::HttpRequestPtr &req, AuthError &err) const;
	json parseRequestBody(const drogon::HttpRequestPtr &req, bool &ok) const;
	// Runs work on the pool and answers from there; 503 when the pool is saturated.
	void runAsync(Callback cb, std::function<service::ServiceReply()> work);

	static void respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code = drogon::k200OK);
	static void unauthorized(const Callback &cb, const AuthError &err);
	static void badRequest(const Callback &cb, const std::string &msg);

	config::Config config_;
	std::shared_ptr<service::QuizService> service_;
	std::shared_ptr<service::WorkerPool> pool_;
};

} // namespace gateway

#include "gateway.hpp"

#include <iostream>
#include <stdexcept>

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>

#include "text_util.hpp"

namespace gateway {

json fromJsoncpp(const Json::Value &v) {
	switch (v.type()) {
	case Json::nullValue: return nullptr;
	case Json::intValue: return static_cast<int64_t>(v.asInt64());
	case Json::uintValue: return static_cast<uint64_t>(v.asUInt64());
	case Json::realValue: return v.asDouble();
	case Json::stringValue: return v.asString();
	case Json::booleanValue: return v.asBool();
	case Json::arrayValue: {
		json out = json::array();
		for (const auto &item : v) out.push_back(fromJsoncpp(item));
		return out;
	}
	case Json::objectValue: {
		json out = json::object();
		for (auto it = v.begin(); it != v.end(); ++it) out[it.name()] = fromJsoncpp(*it);
		return out;
	}
	}
	return nullptr;
}

Json::Value toJsoncpp(const json &v) {
	if (v.is_boolean()) return Json::Value(v.get<bool>());
	if (v.is_number_integer()) return Json::Value(static_cast<Json::Int64>(v.get<int64_t>()));
	if (v.is_number_unsigned()) return Json::Value(static_cast<Json::UInt64>(v.get<uint64_t>()));
	if (v.is_number_float()) return Json::Value(v.get<double>());
	if (v.is_string()) return Json::Value(v.get<std::string>());
	if (v.is_array()) {
		Json::Value arr(Json::arrayValue);
		for (const auto &item : v) arr.append(toJsoncpp(item));
		return arr;
	}
	if (v.is_object()) {
		Json::Value obj(Json::objectValue);
		for (auto it = v.begin(); it != v.end(); ++it) obj[it.key()] = toJsoncpp(it.value());
		return obj;
	}
	return Json::Value();
}

GatewayServer::GatewayServer(config::Config config, std::shared_ptr<service::QuizService> service)
	: config_(std::move(config)), service_(std::move(service)) {
	pool_ = std::make_shared<service::WorkerPool>(config_.workers, static_cast<std::size_t>(config_.workers) * 16);
	if (!config_.authEnabled) std::cout << "[Gateway] auth disabled" << std::endl;
	setupRoutes();
}

void GatewayServer::listen() {
	if (config_.port < 1 || config_.port > 65535) throw std::invalid_argument("port out of range: " + std::to_string(config_.port));
	std::cout << "[Gateway] listening on " << config_.host << ":" << config_.port << " with " << pool_->workers()
			  << " workers" << std::endl;
	drogon::app().addListener(config_.host, static_cast<uint16_t>(config_.port));
	drogon::app().run();
	pool_->stop();
}

bool GatewayServer::authOK(const drogon::HttpRequestPtr &req, AuthError &err) const {
	if (!config_.authEnabled) return true;
	if (req->method() == drogon::Options) return true;
	if (req->path().rfind("/api/", 0) != 0) return true;

	std::string auth = textutil::trimCopy(req->getHeader("authorization"));
	std::string token;
	if (auth.size() > 7 && textutil::lowerAscii(auth.substr(0, 7)) == "bearer ") token = textutil::trimCopy(auth.substr(7));
	if (token.empty()) {
		err = {"unauthorized", ""};
		return false;
	}
	try {
		auto dec = jwt::decode<jwt::traits::nlohmann_json>(token);
		jwt::verify<jwt::traits::nlohmann_json>()
			.allow_algorithm(jwt::algorithm::hs256{config_.jwtSecret})
			.verify(dec);
		return true;
	} catch (const std::exception &e) {
		err = {"invalid-token", e.what()};
		return false;
	}
}

json GatewayServer::parseRequestBody(const drogon::HttpRequestPtr &req, bool &ok) const {
	ok = true;
	auto payload = req->getJsonObject();
	if (payload) return fromJsoncpp(*payload);
	auto body = req->getBody();
	if (body.empty()) return json::object();
	try {
		return json::parse(std::string(body));
	} catch (const json::parse_error &) {
		ok = false;
		return json();
	}
}

void GatewayServer::runAsync(Callback cb, std::function<service::ServiceReply()> work) {
	bool queued = pool_->submit([cb, work]() {
		try {
			auto reply = work();
			respondJson(cb, reply.body, static_cast<drogon::HttpStatusCode>(reply.status));
		} catch (const std::exception &e) {
			std::cerr << "[Gateway] request failed: " << e.what() << std::endl;
			respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
		}
	});
	if (!queued) respondJson(cb, json{{"ok", false}, {"error", "server busy"}}, drogon::k503ServiceUnavailable);
}

void GatewayServer::setupRoutes() {
	drogon::app().registerHandler("/health", [](const drogon::HttpRequestPtr &, Callback &&cb) {
		respondJson(cb, json{{"ok", true}, {"message", "Backend is running"}});
	}, {drogon::Get});

	drogon::app().registerHandler("/api/budget", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		AuthError err;
		if (!authOK(req, err)) return unauthorized(cb, err);
		respondJson(cb, service_->budgetStatus());
	}, {drogon::Get});

	drogon::app().registerHandler("/api/generate-quiz", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		AuthError err;
		if (!authOK(req, err)) return unauthorized(cb, err);
		bool ok = true;
		json body = parseRequestBody(req, ok);
		if (!ok) return badRequest(cb, "invalid json");
		auto svc = service_;
		runAsync(std::move(cb), [svc, body]() { return svc->generateQuiz(body); });
	}, {drogon::Post});

	drogon::app().registerHandler("/api/grade", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		AuthError err;
		if (!authOK(req, err)) return unauthorized(cb, err);
		bool ok = true;
		json body = parseRequestBody(req, ok);
		if (!ok) return badRequest(cb, "invalid json");
		auto svc = service_;
		runAsync(std::move(cb), [svc, body]() { return svc->grade(body); });
	}, {drogon::Post});
}

void GatewayServer::respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code) {
	auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(j));
	resp->setStatusCode(code);
	cb(resp);
}

void GatewayServer::unauthorized(const Callback &cb, const AuthError &err) {
	json payload{{"ok", false}, {"error", err.error.empty() ? "unauthorized" : err.error}};
	if (!err.message.empty()) payload["message"] = err.message;
	respondJson(cb, payload, drogon::k401Unauthorized);
}

void GatewayServer::badRequest(const Callback &cb, const std::string &msg) {
	respondJson(cb, json{{"ok", false}, {"error", msg}}, drogon::k400BadRequest);
}

} // namespace gateway

#include "answer_store.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace answers {

json toJson(const AnswerKey &key) {
	return json{{"type", quiz::toString(key.type)}, {"question", key.question}, {"answer", key.answer}};
}

std::optional<AnswerKey> answerKeyFrom(const json &j) {
	if (!j.is_object()) return std::nullopt;
	if (!j.contains("type") || !j["type"].is_string()) return std::nullopt;
	auto type = quiz::parseItemType(j["type"].get<std::string>());
	if (!type) return std::nullopt;
	AnswerKey key;
	key.type = *type;
	key.question = j.value("question", "");
	if (!j.contains("answer")) return std::nullopt;
	const auto &a = j["answer"];
	if (a.is_string()) key.answer = a.get<std::string>();
	else if (a.is_boolean()) key.answer = a.get<bool>() ? "true" : "false";
	else return std::nullopt;
	return key;
}

std::string referenceAnswer(const quiz::QuizItem &item) {
	return std::visit([](const auto &it) -> std::string {
		using T = std::decay_t<decltype(it)>;
		if constexpr (std::is_same_v<T, quiz::TrueFalseItem>) {
			return it.answer.is_boolean() ? (it.answer.template get<bool>() ? "true" : "false") : "";
		} else {
			return it.answer;
		}
	}, item);
}

std::optional<AnswerKey> MemoryAnswerStore::find(const std::string &id) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = data_.find(id);
	if (it == data_.end()) return std::nullopt;
	return it->second;
}

void MemoryAnswerStore::put(const std::string &id, const AnswerKey &key) {
	std::lock_guard<std::mutex> lock(mu_);
	data_[id] = key;
}

void MemoryAnswerStore::putAll(const std::vector<std::pair<std::string, AnswerKey>> &keys) {
	std::lock_guard<std::mutex> lock(mu_);
	for (const auto &kv : keys) data_[kv.first] = kv.second;
}

std::size_t MemoryAnswerStore::size() {
	std::lock_guard<std::mutex> lock(mu_);
	return data_.size();
}

JsonFileAnswerStore::JsonFileAnswerStore(fs::path file) : file_(std::move(file)) {
	if (file_.has_parent_path() && !fs::exists(file_.parent_path())) fs::create_directories(file_.parent_path());
	load();
}

void JsonFileAnswerStore::load() {
	if (!fs::exists(file_)) return;
	std::ifstream in(file_);
	json j;
	try {
		in >> j;
	} catch (const json::parse_error &e) {
		std::cerr << "[AnswerStore] ignoring unreadable " << file_.string() << ": " << e.what() << std::endl;
		return;
	}
	if (!j.is_object()) return;
	size_t skipped = 0;
	for (auto it = j.begin(); it != j.end(); ++it) {
		auto key = answerKeyFrom(it.value());
		if (!key) {
			skipped++;
			continue;
		}
		if (!data_.count(it.key())) order_.push_back(it.key());
		data_[it.key()] = *key;
	}
	std::cout << "[AnswerStore] loaded " << data_.size() << " keys from " << file_.string();
	if (skipped) std::cout << " (" << skipped << " malformed skipped)";
	std::cout << std::endl;
}

void JsonFileAnswerStore::saveLocked() {
	nlohmann::ordered_json j = nlohmann::ordered_json::object();
	for (const auto &id : order_) {
		auto it = data_.find(id);
		if (it == data_.end()) continue;
		auto &entry = j[id];
		entry["type"] = quiz::toString(it->second.type);
		entry["question"] = it->second.question;
		entry["answer"] = it->second.answer;
	}
	fs::path tmp = file_;
	tmp += ".tmp";
	{
		std::ofstream out(tmp, std::ios::trunc);
		if (!out) throw std::runtime_error("cannot write answer store " + tmp.string());
		out << j.dump(2);
	}
	fs::rename(tmp, file_);
}

std::optional<AnswerKey> JsonFileAnswerStore::find(const std::string &id) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = data_.find(id);
	if (it == data_.end()) return std::nullopt;
	return it->second;
}

void JsonFileAnswerStore::put(const std::string &id, const AnswerKey &key) {
	std::lock_guard<std::mutex> lock(mu_);
	if (!data_.count(id)) order_.push_back(id);
	data_[id] = key;
	saveLocked();
}

void JsonFileAnswerStore::putAll(const std::vector<std::pair<std::string, AnswerKey>> &keys) {
	if (keys.empty()) return;
	std::lock_guard<std::mutex> lock(mu_);
	for (const auto &kv : keys) {
		if (!data_.count(kv.first)) order_.push_back(kv.first);
		data_[kv.first] = kv.second;
	}
	saveLocked();
}

std::size_t JsonFileAnswerStore::size() {
	std::lock_guard<std::mutex> lock(mu_);
	return data_.size();
}

} // namespace answers

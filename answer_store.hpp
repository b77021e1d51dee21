#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "quiz_item.hpp"

namespace answers {

using json = nlohmann::json;
namespace fs = std::filesystem;

struct AnswerKey {
	quiz::ItemType type{quiz::ItemType::ShortAnswer};
	std::string question;
	std::string answer;
};

json toJson(const AnswerKey &key);
std::optional<AnswerKey> answerKeyFrom(const json &j);

// Reference answer for a question, as served to grading.
std::string referenceAnswer(const quiz::QuizItem &item);

class AnswerKeyStore {
public:
	virtual ~AnswerKeyStore() = default;
	virtual std::optional<AnswerKey> find(const std::string &id) = 0;
	virtual void put(const std::string &id, const AnswerKey &key) = 0;
	virtual void putAll(const std::vector<std::pair<std::string, AnswerKey>> &keys) = 0;
	virtual std::size_t size() = 0;
};

class MemoryAnswerStore : public AnswerKeyStore {
public:
	std::optional<AnswerKey> find(const std::string &id) override;
	void put(const std::string &id, const AnswerKey &key) override;
	void putAll(const std::vector<std::pair<std::string, AnswerKey>> &keys) override;
	std::size_t size() override;

private:
	std::mutex mu_;
	std::map<std::string, AnswerKey> data_;
};

// {"<id>": {"type": "...", "question": "...", "answer": "..."}, ...} in one file, rewritten on every put.
class JsonFileAnswerStore : public AnswerKeyStore {
public:
	explicit JsonFileAnswerStore(fs::path file);

	std::optional<AnswerKey> find(const std::string &id) override;
	void put(const std::string &id, const AnswerKey &key) override;
	void putAll(const std::vector<std::pair<std::string, AnswerKey>> &keys) override;
	std::size_t size() override;

	const fs::path &file() const { return file_; }

private:
	void load();
	void saveLocked();

	fs::path file_;
	std::mutex mu_;
	std::map<std::string, AnswerKey> data_;
	std::vector<std::string> order_;
};

} // namespace answers

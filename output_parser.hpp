#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace quiz {

using json = nlohmann::json;

class ParseFailure : public std::runtime_error {
public:
	explicit ParseFailure(const std::string &what) : std::runtime_error(what) {}
};

// Drops <think>...</think> blocks, keeps only the body of the first ``` fence, removes BOMs and
// trims backticks/whitespace. Idempotent.
std::string sanitizeOutput(const std::string &raw);

// First '[' through last ']' of already-sanitized text, decoded as JSON. Throws ParseFailure.
json extractJsonArray(const std::string &sanitized);

// sanitizeOutput followed by extractJsonArray.
json parseProviderOutput(const std::string &raw);

} // namespace quiz

#include "output_parser.hpp"

#include "text_util.hpp"

namespace quiz {

namespace {

const std::string kThinkOpen = "<think>";
const std::string kThinkClose = "</think>";
const std::string kFence = "```";
const std::string kBom = "\xEF\xBB\xBF";

std::string removeThinkBlocks(std::string s) {
	while (true) {
		std::string lower = textutil::lowerAscii(s);
		auto open = lower.find(kThinkOpen);
		if (open == std::string::npos) break;
		auto close = lower.find(kThinkClose, open + kThinkOpen.size());
		if (close == std::string::npos) break;
		s.erase(open, close + kThinkClose.size() - open);
	}
	return s;
}

std::string unfence(const std::string &s) {
	auto open = s.find(kFence);
	if (open == std::string::npos) return s;
	auto close = s.find(kFence, open + kFence.size());
	if (close == std::string::npos) return s;
	std::string inner = s.substr(open + kFence.size(), close - open - kFence.size());
	if (textutil::lowerAscii(inner.substr(0, 4)) == "json") inner.erase(0, 4);
	return textutil::trimCopy(inner);
}

std::string removeAll(std::string s, const std::string &needle) {
	size_t pos = 0;
	while ((pos = s.find(needle, pos)) != std::string::npos) s.erase(pos, needle.size());
	return s;
}

std::string stripEdges(const std::string &s) {
	const char *junk = "` \n\r\t";
	auto start = s.find_first_not_of(junk);
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(junk);
	return s.substr(start, end - start + 1);
}

std::string sanitizeOnce(const std::string &raw) {
	std::string text = textutil::trimCopy(removeThinkBlocks(raw));
	text = unfence(text);
	text = removeAll(text, kBom);
	return stripEdges(text);
}

} // namespace

std::string sanitizeOutput(const std::string &raw) {
	// Each pass either leaves the text alone or shortens it, so this reaches a fixed point.
	std::string cur = sanitizeOnce(raw);
	while (true) {
		std::string next = sanitizeOnce(cur);
		if (next == cur) return cur;
		cur = std::move(next);
	}
}

json extractJsonArray(const std::string &sanitized) {
	auto start = sanitized.find('[');
	auto end = sanitized.rfind(']');
	if (start == std::string::npos || end == std::string::npos || end <= start) {
		throw ParseFailure("no JSON array found in model output");
	}
	try {
		return json::parse(sanitized.substr(start, end - start + 1));
	} catch (const json::parse_error &e) {
		throw ParseFailure(std::string("failed to parse JSON array: ") + e.what());
	}
}

json parseProviderOutput(const std::string &raw) {
	return extractJsonArray(sanitizeOutput(raw));
}

} // namespace quiz

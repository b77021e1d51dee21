#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

#include <rapidfuzz/fuzz.hpp>

namespace textutil {

namespace {

size_t sequenceLength(unsigned char lead) {
	if (lead >= 0xF0) return 4;
	if (lead >= 0xE0) return 3;
	if (lead >= 0xC0) return 2;
	return 1;
}

uint32_t decodeAt(const std::string &s, size_t i, size_t len) {
	static const unsigned char kLeadMask[] = {0, 0x7F, 0x1F, 0x0F, 0x07};
	uint32_t cp = static_cast<unsigned char>(s[i]) & kLeadMask[len];
	for (size_t k = 1; k < len; k++) cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
	return cp;
}

// Latin-1 marks, General Punctuation, CJK punctuation and fullwidth ASCII punctuation.
bool isUnicodePunctuation(uint32_t cp) {
	if (cp == 0xA0 || cp == 0xA1 || cp == 0xAB || cp == 0xB7 || cp == 0xBB || cp == 0xBF) return true;
	if (cp >= 0x2000 && cp <= 0x206F) return true;
	if (cp >= 0x3000 && cp <= 0x303F) return true;
	if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20)) return true;
	return false;
}

} // namespace

std::string trimCopy(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(start, end - start + 1);
}

std::string lowerAscii(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	for (unsigned char c : s) {
		if (c < 0x80) out.push_back(static_cast<char>(std::tolower(c)));
		else out.push_back(static_cast<char>(c));
	}
	return out;
}

std::string normalizeText(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	bool pendingSpace = false;
	auto emit = [&](char c) {
		if (pendingSpace && !out.empty()) out.push_back(' ');
		pendingSpace = false;
		out.push_back(c);
	};
	for (size_t i = 0; i < s.size();) {
		unsigned char c = static_cast<unsigned char>(s[i]);
		// U+2018 U+2019 U+201C U+201D
		if (c == 0xE2 && i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0x80) {
			unsigned char t = static_cast<unsigned char>(s[i + 2]);
			if (t == 0x98 || t == 0x99) { emit('\''); i += 3; continue; }
			if (t == 0x9C || t == 0x9D) { emit('"'); i += 3; continue; }
		}
		// U+00A0
		if (c == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xA0) {
			pendingSpace = true;
			i += 2;
			continue;
		}
		if (c < 0x80 && std::isspace(c)) {
			pendingSpace = true;
			i++;
			continue;
		}
		emit(static_cast<char>(c));
		i++;
	}
	return out;
}

std::vector<std::string> wordTokens(const std::string &s) {
	std::vector<std::string> out;
	std::string cur;
	auto flush = [&]() {
		if (!cur.empty()) out.push_back(cur);
		cur.clear();
	};
	for (size_t i = 0; i < s.size();) {
		unsigned char c = static_cast<unsigned char>(s[i]);
		if (c < 0x80) {
			if (std::isalnum(c)) cur.push_back(static_cast<char>(std::tolower(c)));
			else flush();
			i++;
			continue;
		}
		size_t len = sequenceLength(c);
		if (i + len > s.size()) len = s.size() - i;
		if (isUnicodePunctuation(decodeAt(s, i, len))) flush();
		else cur.append(s, i, len);
		i += len;
	}
	flush();
	return out;
}

double similarityRatio(const std::string &a, const std::string &b) {
	if (a.empty() && b.empty()) return 1.0;
	return rapidfuzz::fuzz::ratio(a, b) / 100.0;
}

std::string truncateUtf8(const std::string &s, std::size_t maxBytes) {
	if (s.size() <= maxBytes) return s;
	std::size_t cut = maxBytes;
	while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
	return s.substr(0, cut);
}

std::size_t utf8Length(const std::string &s) {
	std::size_t n = 0;
	for (unsigned char c : s) {
		if ((c & 0xC0) != 0x80) n++;
	}
	return n;
}

bool containsCi(const std::string &haystack, const std::string &needle) {
	return lowerAscii(haystack).find(lowerAscii(needle)) != std::string::npos;
}

} // namespace textutil

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

std::string trimCopy(const std::string &s);
std::string lowerAscii(const std::string &s);

// Curly quotes to straight quotes, every whitespace run (including NBSP) to one space, trimmed.
std::string normalizeText(const std::string &s);

// Lower-cased ASCII letters and digits only; everything else dropped.

// Lower-cased alphanumeric words in order of appearance. Non-ASCII letters are kept
// unchanged; Unicode punctuation separates words.
std::vector<std::string> wordTokens(const std::string &s);

// Normalized Indel similarity in [0, 1]: 2 * LCS / (|a| + |b|). Two empty strings score 1.
double similarityRatio(const std::string &a, const std::string &b);

// Cuts at maxBytes without splitting a UTF-8 sequence.
std::string truncateUtf8(const std::string &s, std::size_t maxBytes);

// Number of UTF-8 code points.
std::size_t utf8Length(const std::string &s);

bool containsCi(const std::string &haystack, const std::string &needle);

} // namespace textutil

#pragma once
#include <string>
#include <vector>

namespace textutil {

// lowercase, keep ASCII letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop tokens shorter than 2 chars
std::vector<std::string> tokenize(const std::string& normalized);

bool is_stopword(const std::string& token);

std::vector<std::string> remove_stopwords(const std::vector<std::string>& tokens);

// normalize + tokenize + remove_stopwords
std::vector<std::string> content_tokens(const std::string& raw);

// adjacent pairs joined by a single space ("interest rate")
std::vector<std::string> bigrams(const std::vector<std::string>& tokens);

std::string trim(const std::string& s);

// every whitespace run becomes a single space, ends trimmed
std::string collapse_whitespace(const std::string& s);

// Sentence boundary = run of . ! ? (optionally followed by closing quotes or
// brackets) then whitespace or end of text. Common abbreviations and single
// capital initials do not end a sentence. Text after the last boundary is the
// final sentence. Returns {} when the text has no boundary at all.
// Sentences are trimmed substrings of the input, in document order.
std::vector<std::string> split_sentences(const std::string& text);

}

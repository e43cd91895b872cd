#include "text/TextUtil.hpp"
#include <cctype>
#include <unordered_set>

namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                if (cur.size() >= 2) tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (cur.size() >= 2) tokens.push_back(cur);
    return tokens;
}

bool is_stopword(const std::string& token) {
    static const std::unordered_set<std::string> stop = {
        "about", "above", "after", "again", "against", "all", "am", "an", "and", "any",
        "are", "as", "at", "be", "because", "been", "before", "being", "below", "between",
        "both", "but", "by", "can", "could", "did", "do", "does", "doing", "don", "down",
        "during", "each", "few", "for", "from", "further", "had", "has", "have", "having",
        "he", "her", "here", "hers", "herself", "him", "himself", "his", "how", "if", "in",
        "into", "is", "it", "its", "itself", "just", "me", "might", "more", "most", "must",
        "my", "myself", "no", "nor", "not", "now", "of", "off", "on", "once", "only", "or",
        "other", "our", "ours", "ourselves", "out", "over", "own", "same", "shall", "she",
        "should", "so", "some", "such", "than", "that", "the", "their", "theirs", "them",
        "themselves", "then", "there", "these", "they", "this", "those", "through", "to",
        "too", "under", "until", "up", "very", "was", "we", "were", "what", "when", "where",
        "which", "while", "who", "whom", "why", "will", "with", "would", "you", "your",
        "yours", "yourself", "yourselves", "also", "said", "says", "may", "us"
    };
    return stop.find(token) != stop.end();
}

std::vector<std::string> remove_stopwords(const std::vector<std::string>& tokens) {
    std::vector<std::string> out;
    out.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (!is_stopword(t)) out.push_back(t);
    }
    return out;
}

std::vector<std::string> content_tokens(const std::string& raw) {
    return remove_stopwords(tokenize(normalize(raw)));
}

std::vector<std::string> bigrams(const std::vector<std::string>& tokens) {
    std::vector<std::string> out;
    if (tokens.size() < 2) return out;
    out.reserve(tokens.size() - 1);
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        out.push_back(tokens[i] + " " + tokens[i + 1]);
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

// ---------- sentence splitting ----------

static bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

static bool is_closer(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']';
}

// word immediately before text[dot] (letters and inner dots), e.g. "Mr", "U.S"
static std::string word_before(const std::string& text, size_t dot) {
    size_t b = dot;
    while (b > 0) {
        unsigned char c = static_cast<unsigned char>(text[b - 1]);
        if (std::isalpha(c) || c == '.') --b;
        else break;
    }
    return text.substr(b, dot - b);
}

static bool is_abbreviation(const std::string& word) {
    static const std::unordered_set<std::string> abbrev = {
        "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "st", "vs", "gen", "gov", "sen",
        "rep", "lt", "col", "sgt", "capt", "inc", "corp", "ltd", "co", "jan", "feb",
        "mar", "apr", "aug", "sept", "sep", "oct", "nov", "dec", "u.s", "u.k", "u.n",
        "e.g", "i.e", "a.m", "p.m"
    };

    if (word.empty()) return false;

    // single capital initial ("John F. Kennedy")
    if (word.size() == 1 && std::isupper(static_cast<unsigned char>(word[0]))) return true;

    std::string lower;
    lower.reserve(word.size());
    for (char c : word) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return abbrev.find(lower) != abbrev.end();
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> out;
    const size_t n = text.size();

    bool found_boundary = false;
    size_t start = 0;

    for (size_t i = 0; i < n; ++i) {
        if (!is_terminal(text[i])) continue;

        size_t j = i;
        while (j + 1 < n && is_terminal(text[j + 1])) ++j;

        size_t k = j;
        while (k + 1 < n && is_closer(text[k + 1])) ++k;

        const size_t end = k + 1;
        const bool at_break = (end == n) || std::isspace(static_cast<unsigned char>(text[end]));
        if (!at_break) {
            i = k;
            continue;
        }

        // end of text always closes a sentence, even after "U.S."
        const bool at_text_end = text.find_first_not_of(" \t\r\n\f\v", end) == std::string::npos;
        if (!at_text_end && text[i] == '.' && j == i && is_abbreviation(word_before(text, i))) {
            i = k;
            continue;
        }

        std::string s = trim(text.substr(start, end - start));
        if (!s.empty()) out.push_back(std::move(s));
        start = end;
        found_boundary = true;
        i = k;
    }

    if (!found_boundary) return {};

    if (start < n) {
        std::string tail = trim(text.substr(start));
        if (!tail.empty()) out.push_back(std::move(tail));
    }
    return out;
}

}

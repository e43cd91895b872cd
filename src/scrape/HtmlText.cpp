#include "scrape/HtmlText.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <unordered_map>

namespace newscheckr {
namespace scrape {

static std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// case-insensitive removal of every open...close range (unterminated range drops the rest)
static std::string drop_ranges(const std::string& html, const std::string& open, const std::string& close) {
    const std::string lower = to_lower(html);
    std::string out;
    out.reserve(html.size());

    size_t pos = 0;
    while (pos < html.size()) {
        const size_t a = lower.find(open, pos);
        if (a == std::string::npos) {
            out.append(html, pos, std::string::npos);
            break;
        }
        out.append(html, pos, a - pos);
        out.push_back(' ');

        const size_t b = lower.find(close, a + open.size());
        if (b == std::string::npos) break;
        pos = b + close.size();
    }
    return out;
}

static bool tag_name_ends(const std::string& lower, size_t i) {
    if (i >= lower.size()) return false;
    const unsigned char c = static_cast<unsigned char>(lower[i]);
    return c == '>' || c == '/' || std::isspace(c);
}

// inner HTML of every non-nested <tag ...>...</tag> in document order
static std::vector<std::string> inner_html(const std::string& html, const std::string& tag) {
    const std::string lower = to_lower(html);
    const std::string open = "<" + tag;
    const std::string close = "</" + tag;

    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        const size_t a = lower.find(open, pos);
        if (a == std::string::npos) break;
        if (!tag_name_ends(lower, a + open.size())) {
            pos = a + open.size();
            continue;
        }
        const size_t gt = lower.find('>', a);
        if (gt == std::string::npos) break;

        const size_t b = lower.find(close, gt + 1);
        if (b == std::string::npos) break;

        out.push_back(html.substr(gt + 1, b - gt - 1));
        pos = b + close.size();
    }
    return out;
}

static std::map<std::string, std::string> parse_attributes(const std::string& tag) {
    std::map<std::string, std::string> attrs;

    size_t i = 0;
    const size_t n = tag.size();
    // skip "<name"
    while (i < n && tag[i] != ' ' && tag[i] != '\t' && tag[i] != '\n' && tag[i] != '\r') ++i;

    while (i < n) {
        while (i < n && (std::isspace(static_cast<unsigned char>(tag[i])) || tag[i] == '/')) ++i;
        if (i >= n || tag[i] == '>') break;

        const size_t name_start = i;
        while (i < n && tag[i] != '=' && tag[i] != '>' && !std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
        const std::string name = to_lower(tag.substr(name_start, i - name_start));

        while (i < n && std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
        std::string value;
        if (i < n && tag[i] == '=') {
            ++i;
            while (i < n && std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
            if (i < n && (tag[i] == '"' || tag[i] == '\'')) {
                const char q = tag[i++];
                const size_t v0 = i;
                while (i < n && tag[i] != q) ++i;
                value = tag.substr(v0, i - v0);
                if (i < n) ++i;
            } else {
                const size_t v0 = i;
                while (i < n && tag[i] != '>' && !std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
                value = tag.substr(v0, i - v0);
            }
        }
        if (!name.empty()) attrs.emplace(name, value);
    }
    return attrs;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string decode_entities(const std::string& s) {
    static const std::unordered_map<std::string, std::string> named = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", " "}, {"mdash", "-"}, {"ndash", "-"}, {"hellip", "..."},
        {"rsquo", "'"}, {"lsquo", "'"}, {"rdquo", "\""}, {"ldquo", "\""}
    };

    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') {
            out.push_back(s[i]);
            continue;
        }
        const size_t semi = s.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back('&');
            continue;
        }
        const std::string ent = s.substr(i + 1, semi - i - 1);

        if (ent.size() >= 2 && ent[0] == '#') {
            const bool hex = (ent[1] == 'x' || ent[1] == 'X');
            const std::string digits = ent.substr(hex ? 2 : 1);
            char* end = nullptr;
            const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (!digits.empty() && end && *end == '\0' && cp > 0 && cp <= 0x10FFFF) {
                append_utf8(out, static_cast<uint32_t>(cp));
                i = semi;
                continue;
            }
        } else {
            auto it = named.find(ent);
            if (it != named.end()) {
                out += it->second;
                i = semi;
                continue;
            }
        }
        out.push_back('&');
    }
    return out;
}

std::string strip_tags(const std::string& html) {
    std::string out;
    out.reserve(html.size());
    bool in_tag = false;
    for (char c : html) {
        if (in_tag) {
            if (c == '>') {
                in_tag = false;
                out.push_back(' ');
            }
        } else if (c == '<') {
            in_tag = true;
        } else {
            out.push_back(c);
        }
    }
    return textutil::collapse_whitespace(decode_entities(out));
}

HtmlDocument extract_html(const std::string& html) {
    std::string clean = drop_ranges(html, "<!--", "-->");
    clean = drop_ranges(clean, "<script", "</script>");
    clean = drop_ranges(clean, "<style", "</style>");
    clean = drop_ranges(clean, "<noscript", "</noscript>");

    HtmlDocument doc;
    std::string og_title;

    const std::string lower = to_lower(clean);
    size_t pos = 0;
    while (true) {
        const size_t a = lower.find("<meta", pos);
        if (a == std::string::npos) break;
        const size_t gt = lower.find('>', a);
        if (gt == std::string::npos) break;
        pos = gt + 1;

        auto attrs = parse_attributes(clean.substr(a, gt - a + 1));
        std::string key = attrs.count("property") ? attrs["property"] : attrs["name"];
        key = to_lower(key);
        const std::string content = textutil::collapse_whitespace(decode_entities(attrs["content"]));
        if (content.empty()) continue;

        if (key == "og:title" && og_title.empty()) {
            og_title = content;
        } else if (key == "author") {
            bool seen = false;
            for (const auto& x : doc.authors) seen = seen || (x == content);
            if (!seen) doc.authors.push_back(content);
        } else if (key == "article:published_time" && !doc.published_at) {
            doc.published_at = content;
        }
    }

    if (!og_title.empty()) {
        doc.title = og_title;
    } else {
        for (const char* tag : {"title", "h1"}) {
            for (const auto& inner : inner_html(clean, tag)) {
                doc.title = strip_tags(inner);
                if (!doc.title.empty()) break;
            }
            if (!doc.title.empty()) break;
        }
    }

    const auto articles = inner_html(clean, "article");
    const std::string region = articles.empty() ? clean : articles.front();

    std::string text;
    for (const auto& inner : inner_html(region, "p")) {
        const std::string para = strip_tags(inner);
        if (para.empty()) continue;
        if (!text.empty()) text += "\n\n";
        text += para;
    }
    if (text.empty()) text = strip_tags(region);

    doc.text = text;
    return doc;
}

}  // namespace scrape
}  // namespace newscheckr

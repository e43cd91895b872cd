#pragma once

#include <optional>
#include <string>
#include <vector>

namespace newscheckr {
namespace scrape {

struct HtmlDocument {
    std::string title;
    std::vector<std::string> authors;
    std::optional<std::string> published_at;
    std::string text;       // paragraphs separated by blank lines
};

// Title from og:title, <title> or the first <h1>; authors from
// <meta name="author">; publish time from article:published_time.
// Body is the <p> text inside <article> when present, else of the whole page.
// Scripts, styles and comments are dropped, entities decoded, whitespace collapsed.
HtmlDocument extract_html(const std::string& html);

// &amp; &lt; &gt; &quot; &apos; &#39; &nbsp; and numeric references
std::string decode_entities(const std::string& s);

// removes every <...> tag and collapses whitespace
std::string strip_tags(const std::string& html);

}  // namespace scrape
}  // namespace newscheckr

#include "news/Models.hpp"

#include <cctype>

namespace newscheckr {

const char* bias_str(BiasLabel b) {
    switch (b) {
        case BiasLabel::Left: return "Left";
        case BiasLabel::Center: return "Center";
        case BiasLabel::Right: return "Right";
        default: return "Center";
    }
}

bool parse_bias(const std::string& s, BiasLabel& out) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "left") { out = BiasLabel::Left; return true; }
    if (lower == "center") { out = BiasLabel::Center; return true; }
    if (lower == "right") { out = BiasLabel::Right; return true; }
    return false;
}

}  // namespace newscheckr

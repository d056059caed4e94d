#include <lore/search/query_sanitizer.h>

#include <cctype>

namespace lore::search {

namespace {

bool isFtsSyntax(char c) {
    switch (c) {
        case '(':
        case ')':
        case '{':
        case '}':
        case '[':
        case ']':
        case '^':
        case '"':
        case '~':
        case '*':
        case '?':
        case ':':
        case '\\':
            return true;
        default:
            return false;
    }
}

} // namespace

std::string sanitizeFtsQuery(std::string_view query) {
    std::string out;
    out.reserve(query.size());
    bool pendingSpace = false;
    for (char c : query) {
        if (isFtsSyntax(c) || std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> tokenizeSanitized(std::string_view sanitized) {
    std::vector<std::string> tokens;
    std::size_t pos = 0;
    while (pos < sanitized.size()) {
        auto end = sanitized.find(' ', pos);
        if (end == std::string_view::npos) {
            end = sanitized.size();
        }
        if (end > pos) {
            tokens.emplace_back(sanitized.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    return tokens;
}

std::string toFtsMatchExpression(std::string_view query) {
    const auto tokens = tokenizeSanitized(sanitizeFtsQuery(query));
    std::string expr;
    for (const auto& token : tokens) {
        if (!expr.empty()) {
            expr.push_back(' ');
        }
        // Quotes were already stripped, so the token needs no escaping
        expr.push_back('"');
        expr += token;
        expr.push_back('"');
    }
    return expr;
}

} // namespace lore::search

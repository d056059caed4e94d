#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lore::search {

/**
 * @brief Strip FTS5 syntax from free text
 *
 * The characters ( ) { } [ ] ^ " ~ * ? : \ become spaces, whitespace runs
 * collapse to one space and the ends are trimmed.
 */
std::string sanitizeFtsQuery(std::string_view query);

std::vector<std::string> tokenizeSanitized(std::string_view sanitized);

/**
 * @brief MATCH expression for a user query
 *
 * Every remaining token is emitted as a quoted string, so bare AND, OR, NOT,
 * NEAR and hyphenated words are matched literally. Tokens are implicitly
 * AND-ed. Returns an empty string when nothing searchable remains.
 */
std::string toFtsMatchExpression(std::string_view query);

} // namespace lore::search

#ifndef COMMENT_REMOVER_COMMENT_STRIPPER_HPP
#define COMMENT_REMOVER_COMMENT_STRIPPER_HPP

#include <string>

#include "logger.hpp"

namespace comment_remover {

// Removes HTML comment spans ("<!--" up to the nearest following "-->", newlines included).
// With a non-empty filter, only spans whose text contains the filter (literal,
// case-sensitive) are removed; every other span is left untouched.
// If matching fails (e.g. out of memory), the error is logged and the content is returned unchanged.
// comments_removed is incremented by the number of spans removed.
std::string strip_html_comments(const std::string& content,
                                const std::string& filter,
                                Logger& logger,
                                long long& comments_removed);

std::string strip_html_comments(const std::string& content,
                                const std::string& filter,
                                Logger& logger);

} // namespace comment_remover

#endif // COMMENT_REMOVER_COMMENT_STRIPPER_HPP

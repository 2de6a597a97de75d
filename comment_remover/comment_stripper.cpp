#include "comment_stripper.hpp"

#include <exception>
#include <string_view>

namespace comment_remover {

namespace {

const std::string kCommentOpen = "<!--";
const std::string kCommentClose = "-->";

} // namespace

std::string strip_html_comments(const std::string& content,
                                const std::string& filter,
                                Logger& logger,
                                long long& comments_removed) {
    try {
        std::string result;
        result.reserve(content.length());
        long long removed_in_content = 0;
        std::string::size_type copied_up_to = 0;
        std::string::size_type search_from = 0;

        // Each span runs from "<!--" to the nearest following "-->", newlines included.
        // The close marker may not overlap the open marker ("<!-->" is not a span).
        while (true) {
            std::string::size_type open_pos = content.find(kCommentOpen, search_from);
            if (open_pos == std::string::npos) break;
            std::string::size_type close_pos = content.find(kCommentClose, open_pos + kCommentOpen.length());
            if (close_pos == std::string::npos) break; // Unterminated, keep the rest as is
            std::string::size_type span_end = close_pos + kCommentClose.length();
            search_from = span_end;

            std::string_view span_text = std::string_view(content).substr(open_pos, span_end - open_pos);
            if (!filter.empty() && span_text.find(filter) == std::string_view::npos) {
                continue; // Span does not mention the filter, keep it
            }
            result.append(content, copied_up_to, open_pos - copied_up_to);
            copied_up_to = span_end;
            ++removed_in_content;
        }
        result.append(content, copied_up_to, std::string::npos);

        comments_removed += removed_in_content;
        return result;
    } catch (const std::exception& e) {
        logger.error(std::string("Error removing comments: ") + e.what());
        return content;
    }
}

std::string strip_html_comments(const std::string& content,
                                const std::string& filter,
                                Logger& logger) {
    long long ignored_count = 0;
    return strip_html_comments(content, filter, logger, ignored_count);
}

} // namespace comment_remover

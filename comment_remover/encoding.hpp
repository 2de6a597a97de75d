#ifndef COMMENT_REMOVER_ENCODING_HPP
#define COMMENT_REMOVER_ENCODING_HPP

#include <string>

namespace comment_remover {

// Used when neither --encoding nor detection provides a charset.
extern const char* const kDefaultEncoding;

// Guesses the charset of raw file bytes with ICU's statistical detector.
// Returns the charset name, or an empty string if nothing could be detected.
std::string detect_encoding(const std::string& raw_bytes);

// Strict conversions between a named charset and UTF-8.
// Unknown charsets, illegal input bytes and unmappable characters make the
// call fail with error_message set; output is only assigned on success.
bool decode_to_utf8(const std::string& raw_bytes, const std::string& encoding,
                    std::string& utf8_text, std::string& error_message);

bool encode_from_utf8(const std::string& utf8_text, const std::string& encoding,
                      std::string& raw_bytes, std::string& error_message);

} // namespace comment_remover

#endif // COMMENT_REMOVER_ENCODING_HPP

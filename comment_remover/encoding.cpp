#include "encoding.hpp"

#include <cstdint>
#include <limits>       // For std::numeric_limits
#include <memory>       // For std::unique_ptr with ICU close functions

#include <unicode/ucnv.h>
#include <unicode/ucsdet.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace comment_remover {

const char* const kDefaultEncoding = "UTF-8";

namespace {

struct ConverterCloser {
    void operator()(UConverter* converter) const { ucnv_close(converter); }
};
struct DetectorCloser {
    void operator()(UCharsetDetector* detector) const { ucsdet_close(detector); }
};

using ConverterPtr = std::unique_ptr<UConverter, ConverterCloser>;
using DetectorPtr = std::unique_ptr<UCharsetDetector, DetectorCloser>;

// Opens a converter that stops on illegal or unmappable input instead of substituting.
ConverterPtr open_strict_converter(const std::string& encoding, std::string& error_message) {
    if (encoding.empty()) {
        error_message = "No encoding name given";
        return nullptr;
    }
    UErrorCode status = U_ZERO_ERROR;
    ConverterPtr converter(ucnv_open(encoding.c_str(), &status));
    if (U_FAILURE(status) || !converter) {
        error_message = "Unknown encoding '" + encoding + "' (" + u_errorName(status) + ")";
        return nullptr;
    }
    ucnv_setToUCallBack(converter.get(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
    ucnv_setFromUCallBack(converter.get(), UCNV_FROM_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
    if (U_FAILURE(status)) {
        error_message = "Could not configure converter for '" + encoding + "' (" + u_errorName(status) + ")";
        return nullptr;
    }
    return converter;
}

bool fits_icu_length(std::size_t size) {
    return size <= static_cast<std::size_t>(std::numeric_limits<int32_t>::max());
}

} // namespace

std::string detect_encoding(const std::string& raw_bytes) {
    if (raw_bytes.empty()) return "";

    UErrorCode status = U_ZERO_ERROR;
    DetectorPtr detector(ucsdet_open(&status));
    if (U_FAILURE(status) || !detector) return "";

    // Skip markup so tag names do not skew the byte statistics
    ucsdet_enableInputFilter(detector.get(), true);

    int32_t sample_length = fits_icu_length(raw_bytes.size())
        ? static_cast<int32_t>(raw_bytes.size())
        : std::numeric_limits<int32_t>::max();
    ucsdet_setText(detector.get(), raw_bytes.data(), sample_length, &status);
    if (U_FAILURE(status)) return "";

    const UCharsetMatch* best_match = ucsdet_detect(detector.get(), &status);
    if (U_FAILURE(status) || best_match == nullptr) return "";

    const char* charset_name = ucsdet_getName(best_match, &status);
    if (U_FAILURE(status) || charset_name == nullptr) return "";
    return charset_name;
}

bool decode_to_utf8(const std::string& raw_bytes, const std::string& encoding,
                    std::string& utf8_text, std::string& error_message) {
    if (!fits_icu_length(raw_bytes.size())) {
        error_message = "Input of " + std::to_string(raw_bytes.size()) + " bytes is too large to decode";
        return false;
    }
    ConverterPtr converter = open_strict_converter(encoding, error_message);
    if (!converter) return false;

    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString unicode_text(raw_bytes.data(), static_cast<int32_t>(raw_bytes.size()),
                                    converter.get(), status);
    if (U_FAILURE(status)) {
        error_message = "'" + encoding + "' codec can't decode input (" + u_errorName(status) + ")";
        return false;
    }

    std::string decoded;
    unicode_text.toUTF8String(decoded);
    utf8_text.swap(decoded);
    return true;
}

bool encode_from_utf8(const std::string& utf8_text, const std::string& encoding,
                      std::string& raw_bytes, std::string& error_message) {
    if (!fits_icu_length(utf8_text.size())) {
        error_message = "Text of " + std::to_string(utf8_text.size()) + " bytes is too large to encode";
        return false;
    }
    ConverterPtr converter = open_strict_converter(encoding, error_message);
    if (!converter) return false;

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8_text.data(), static_cast<int32_t>(utf8_text.size())));
    if (unicode_text.isEmpty()) {
        raw_bytes.clear();
        return true;
    }

    // Preflight for the output size, then convert for real
    UErrorCode status = U_ZERO_ERROR;
    int32_t required_bytes = unicode_text.extract(nullptr, 0, converter.get(), status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        error_message = "'" + encoding + "' codec can't encode text (" + u_errorName(status) + ")";
        return false;
    }

    ucnv_reset(converter.get());
    status = U_ZERO_ERROR;
    std::string encoded(static_cast<std::size_t>(required_bytes), '\0');
    unicode_text.extract(&encoded[0], required_bytes, converter.get(), status);
    if (U_FAILURE(status)) {
        error_message = "'" + encoding + "' codec can't encode text (" + u_errorName(status) + ")";
        return false;
    }
    raw_bytes.swap(encoded);
    return true;
}

} // namespace comment_remover

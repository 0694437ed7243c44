#include "normalizer.hpp"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <fmt/format.h>
#include <stdexcept>

namespace inventory {

namespace {

const icu::Normalizer2 &nfc() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *n = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || n == nullptr)
        throw std::runtime_error(fmt::format("ICU NFC normalizer unavailable: {}", u_errorName(status)));
    return *n;
}

icu::UnicodeString to_nfc(const icu::UnicodeString &s) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString out = nfc().normalize(s, status);
    if (U_FAILURE(status))
        throw std::runtime_error(fmt::format("NFC normalization failed: {}", u_errorName(status)));
    return out;
}

// UnicodeString::trim() only knows about u_isWhitespace; NBSP shows up in
// names pasted from spreadsheets, so strip every u_isUWhiteSpace code point.
icu::UnicodeString strip(const icu::UnicodeString &s) {
    int32_t begin = 0;
    int32_t end = s.length();
    while (begin < end && u_isUWhiteSpace(s.char32At(begin))) begin = s.moveIndex32(begin, 1);
    while (end > begin) {
        const int32_t prev = s.moveIndex32(end, -1);
        if (!u_isUWhiteSpace(s.char32At(prev))) break;
        end = prev;
    }
    return icu::UnicodeString(s, begin, end - begin);
}

icu::UnicodeString stripped(const std::string &raw) {
    return strip(icu::UnicodeString::fromUTF8(icu::StringPiece(raw.data(), static_cast<int32_t>(raw.size()))));
}

} // namespace

bool is_blank_name(const std::string &raw) {
    return stripped(raw).isEmpty();
}

std::string normalize_name(const std::string &raw) {
    icu::UnicodeString u = stripped(raw);
    if (u.isEmpty()) return {};

    u = to_nfc(u);
    u.foldCase(U_FOLD_CASE_DEFAULT);
    // Folding can leave a sequence that is no longer composed.
    u = to_nfc(u);

    std::string out;
    u.toUTF8String(out);
    return out;
}

}

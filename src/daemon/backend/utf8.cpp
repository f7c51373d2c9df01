#include "backend/utf8.hpp"

namespace {

constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

// Expected sequence length for a lead byte and the allowed range of the
// second byte; 0 for bytes that never start a sequence.
struct Lead {
    size_t len;
    unsigned char lo;
    unsigned char hi;
};

Lead classify_lead(unsigned char c) {
    if (c >= 0xC2 && c <= 0xDF) return {2, 0x80, 0xBF};
    if (c == 0xE0) return {3, 0xA0, 0xBF};
    if (c == 0xED) return {3, 0x80, 0x9F};  // no surrogates
    if (c >= 0xE1 && c <= 0xEF) return {3, 0x80, 0xBF};
    if (c == 0xF0) return {4, 0x90, 0xBF};
    if (c == 0xF4) return {4, 0x80, 0x8F};  // nothing above U+10FFFF
    if (c >= 0xF1 && c <= 0xF3) return {4, 0x80, 0xBF};
    return {0, 0, 0};
}

} // namespace

std::string replace_invalid_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            out += text[i++];
            continue;
        }

        auto lead = classify_lead(c);
        size_t n = 1;
        if (lead.len != 0) {
            for (; n < lead.len && i + n < text.size(); ++n) {
                auto b = static_cast<unsigned char>(text[i + n]);
                unsigned char lo = n == 1 ? lead.lo : 0x80;
                unsigned char hi = n == 1 ? lead.hi : 0xBF;
                if (b < lo || b > hi) break;
            }
        }

        if (lead.len != 0 && n == lead.len) {
            out.append(text.substr(i, n));
        } else {
            out.append(REPLACEMENT);
        }
        i += n;
    }
    return out;
}

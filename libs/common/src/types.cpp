// =============================================================================
// datefmt - Common Types Implementation
// Version: 1.2.0
// =============================================================================

#include "datefmt/common/types.hpp"
#include <cctype>

namespace datefmt {

namespace {

// Folds one byte given the byte before it. Second bytes of the UTF-8
// sequences C3 80..C3 9E (except the multiplication sign C3 97) map to
// their lowercase partners C3 A0..C3 BE.
unsigned char fold_byte(unsigned char c, unsigned char previous) {
    if (previous == 0xC3 && c >= 0x80 && c <= 0x9E && c != 0x97) {
        return static_cast<unsigned char>(c + 0x20);
    }
    if (c < 0x80) return static_cast<unsigned char>(std::tolower(c));
    return c;
}

} // anonymous namespace

const Version& library_version() {
    static const Version version{1, 2, 0};
    return version;
}

String trim(StringView str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == StringView::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return String(str.substr(start, end - start + 1));
}

bool equals_ignore_case(StringView a, StringView b) {
    if (a.size() != b.size()) return false;
    unsigned char previous = 0;
    for (Size i = 0; i < a.size(); ++i) {
        auto ca = static_cast<unsigned char>(a[i]);
        auto cb = static_cast<unsigned char>(b[i]);
        if (fold_byte(ca, previous) != fold_byte(cb, previous)) return false;
        previous = ca;
    }
    return true;
}

bool starts_with_ignore_case(StringView str, StringView prefix) {
    return str.size() >= prefix.size() && equals_ignore_case(str.substr(0, prefix.size()), prefix);
}

String pad_left(StringView str, Size width, char pad) {
    if (str.size() >= width) return String(str);
    return String(width - str.size(), pad) + String(str);
}

String zero_padded(UInt64 value, Size min_digits) {
    return pad_left(std::to_string(value), min_digits, '0');
}

} // namespace datefmt

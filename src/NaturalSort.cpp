#include "NaturalSort.h"
#include <cctype>

namespace {
    bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    // Next run of digits or non-digits starting at pos.
    std::string_view next_run(std::string_view s, size_t& pos) {
        size_t start = pos;
        bool digits = is_digit(s[pos]);
        while (pos < s.size() && is_digit(s[pos]) == digits) ++pos;
        return s.substr(start, pos - start);
    }

    // Compares two digit runs by value without converting them, so runs longer
    // than any integer type still order correctly.
    int compare_numeric(std::string_view a, std::string_view b) {
        size_t za = a.find_first_not_of('0');
        size_t zb = b.find_first_not_of('0');
        a = (za == std::string_view::npos) ? std::string_view() : a.substr(za);
        b = (zb == std::string_view::npos) ? std::string_view() : b.substr(zb);
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        int c = a.compare(b);
        return (c < 0) ? -1 : (c > 0 ? 1 : 0);
    }

    int compare_literal(std::string_view a, std::string_view b) {
        size_t n = std::min(a.size(), b.size());
        for (size_t i = 0; i < n; ++i) {
            unsigned char ca = static_cast<unsigned char>(a[i]);
            unsigned char cb = static_cast<unsigned char>(b[i]);
            if (ca != cb) return ca < cb ? -1 : 1;
        }
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return 0;
    }
}

int natural_compare(std::string_view a, std::string_view b) {
    size_t pa = 0, pb = 0;
    while (pa < a.size() && pb < b.size()) {
        std::string_view ra = next_run(a, pa);
        std::string_view rb = next_run(b, pb);

        int c;
        if (is_digit(ra.front()) && is_digit(rb.front())) c = compare_numeric(ra, rb);
        else c = compare_literal(ra, rb);

        if (c != 0) return c;
    }
    // common prefix exhausted: fewer remaining runs sorts first
    bool a_left = pa < a.size();
    bool b_left = pb < b.size();
    if (a_left == b_left) return 0;
    return a_left ? 1 : -1;
}

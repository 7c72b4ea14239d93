#include "core/types.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace mangashelf {

bool ChapterNumber::from_double(double v, ChapterNumber& out) {
    if (!std::isfinite(v) || std::fabs(v) >= 1e15) return false;
    out = from_thousandths(static_cast<int64_t>(
        std::llround(v * static_cast<double>(kChapterNumberScale))));
    return true;
}

bool ChapterNumber::parse(const std::string& text, ChapterNumber& out) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = (text[pos] == '-');
        pos++;
    }

    int64_t whole = 0;
    int whole_digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        // 15 significant digits keep whole * scale inside int64.
        if (++whole_digits > 15) return false;
        whole = whole * 10 + (text[pos] - '0');
        pos++;
    }

    int64_t frac = 0;
    int frac_digits = 0;
    bool round_up = false;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (frac_digits < 3) {
                frac = frac * 10 + (text[pos] - '0');
            } else if (frac_digits == 3) {
                round_up = (text[pos] >= '5');
            }
            frac_digits++;
            pos++;
        }
    }

    if (pos != text.size()) return false;
    if (whole_digits == 0 && frac_digits == 0) return false;

    for (int d = (frac_digits < 3 ? frac_digits : 3); d < 3; d++) frac *= 10;

    int64_t value = whole * kChapterNumberScale + frac + (round_up ? 1 : 0);
    out = from_thousandths(negative ? -value : value);
    return true;
}

std::string ChapterNumber::to_string() const {
    int64_t abs_v = thousandths_ < 0 ? -thousandths_ : thousandths_;
    std::string s = std::to_string(abs_v / kChapterNumberScale);
    int64_t frac = abs_v % kChapterNumberScale;
    if (frac != 0) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%03lld", static_cast<long long>(frac));
        std::string f(buf);
        while (!f.empty() && f.back() == '0') f.pop_back();
        s += "." + f;
    }
    return thousandths_ < 0 ? "-" + s : s;
}

} // namespace mangashelf

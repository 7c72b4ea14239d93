#pragma once

#include <cstdint>
#include <string>

#include "core/config.hpp"

namespace mangashelf {

// Exact decimal chapter number, stored as thousandths (1.5 -> 1500).
// Fractional chapters (interstitial releases) compare exactly.
class ChapterNumber {
public:
    constexpr ChapterNumber() = default;

    static constexpr ChapterNumber from_thousandths(int64_t v) {
        ChapterNumber n;
        n.thousandths_ = v;
        return n;
    }

    static constexpr ChapterNumber from_int(int64_t whole) {
        return from_thousandths(whole * kChapterNumberScale);
    }

    // Rounds to the nearest thousandth. Returns false for NaN, infinity or
    // a magnitude of 1e15 or more (the range parse() accepts).
    static bool from_double(double v, ChapterNumber& out);

    // Parse decimal text such as "12", "1.5", "-3", "0.25".
    // Whole text must be consumed; more than three fractional digits
    // are rounded. Returns false on malformed input.
    static bool parse(const std::string& text, ChapterNumber& out);

    int64_t thousandths() const { return thousandths_; }
    double to_double() const {
        return static_cast<double>(thousandths_) /
               static_cast<double>(kChapterNumberScale);
    }
    bool positive() const { return thousandths_ > 0; }

    // Shortest decimal form: "3", "1.5", "12.25".
    std::string to_string() const;


    bool operator==(const ChapterNumber& o) const { return thousandths_ == o.thousandths_; }
    bool operator!=(const ChapterNumber& o) const { return thousandths_ != o.thousandths_; }
    bool operator<(const ChapterNumber& o) const { return thousandths_ < o.thousandths_; }
    bool operator>(const ChapterNumber& o) const { return thousandths_ > o.thousandths_; }
    bool operator<=(const ChapterNumber& o) const { return thousandths_ <= o.thousandths_; }
    bool operator>=(const ChapterNumber& o) const { return thousandths_ >= o.thousandths_; }

private:
    int64_t thousandths_ = 0;
};

} // namespace mangashelf

#ifndef CCOUNT_CORPUS_HPP
#define CCOUNT_CORPUS_HPP

#include <codecvt>
#include <cstddef>
#include <istream>
#include <locale>
#include <stdexcept>
#include <string>
#include "ccount/frequency_counter.hpp"
#include "ccount/words.hpp"


namespace ccount {

// Unicode White_Space property.
inline bool is_whitespace(const char32_t c) {
    return (c >= 0x0009 && c <= 0x000D)
        || c == 0x0020
        || c == 0x0085
        || c == 0x00A0
        || c == 0x1680
        || (c >= 0x2000 && c <= 0x200A)
        || c == 0x2028
        || c == 0x2029
        || c == 0x202F
        || c == 0x205F
        || c == 0x3000;
}

struct is_token_char {
    bool operator()(const char32_t c) const { return !is_whitespace(c); }
};

// Splits every line of the corpus on whitespace and counts the tokens.
// Invalid UTF-8 and read errors are reported as std::runtime_error.
inline frequency_counter read_token_counts(std::istream& is) {
    std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t> cvt;

    frequency_counter counter;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(is, line)) {
        ++lineno;

        const std::string invalid = "Invalid UTF-8 in corpus at line " + std::to_string(lineno) + ".";

        std::u32string decoded;
        try {
            decoded = cvt.from_bytes(line);
        }
        catch (const std::range_error&) {
            throw std::runtime_error(invalid);
        }
        // a character cut off at the end of the line is dropped, not reported.
        if (cvt.converted() != line.size()) {
            throw std::runtime_error(invalid);
        }
        for (const char32_t c : decoded) {
            if (c >= 0xD800 && c <= 0xDFFF) {
                throw std::runtime_error(invalid);
            }
        }

        for (const auto& w : make_words(decoded, is_token_char())) {
            counter.add(cvt.to_bytes(&*w.begin(), &*w.begin() + w.size()));
        }
    }
    if (is.bad()) {
        throw std::runtime_error("Failed to read the corpus.");
    }

    return counter;
}

}  // namespace ccount


#endif  /* CCOUNT_CORPUS_HPP */

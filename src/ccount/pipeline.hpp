#ifndef CCOUNT_PIPELINE_HPP
#define CCOUNT_PIPELINE_HPP

#include <cstddef>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <boost/optional/optional.hpp>
#include "ccount/corpus.hpp"
#include "ccount/frequency_counter.hpp"
#include "ccount/ngrams.hpp"
#include "ccount/printers.hpp"
#include "ccount/rank_sort.hpp"


namespace ccount {

struct count_options {
    count_type  token_min    = 1;
    count_type  ngram_min    = 1;
    std::size_t min_n        = 3;
    std::size_t max_n        = 6;
    bool        filter_first = false;
    bool        bracket      = true;
    bool        verbose      = false;
};

inline void validate(const count_options& opts) {
    if (opts.min_n == 0) {
        throw std::invalid_argument("The minimum n-gram length cannot be zero.");
    }
    if (opts.min_n > opts.max_n) {
        throw std::invalid_argument("The maximum length should be equal to or greater than the minimum length.");
    }
}

inline std::string bracketed(const std::string& token) {
    std::string b;
    b.reserve(token.size() + 2);
    b += '<';
    b += token;
    b += '>';
    return b;
}

// Counts the tokens of the corpus and, if an n-gram printer is given, the
// character n-grams of those tokens weighted by token count.
//
// Without filter_first, token_min neither restricts the n-gram input nor the
// printed token list.
template <class ResultPrinter>
void count_corpus(std::istream& corpus,
                  ResultPrinter& token_printer,
                  boost::optional<ResultPrinter&> ngram_printer,
                  const count_options& opts,
                  std::ostream& log)
{
    validate(opts);

    frequency_counter token_counter = read_token_counts(corpus);
    if (opts.verbose) {
        log << "Read " << token_counter.total() << " tokens, "
            << token_counter.size() << " distinct." << std::endl;
    }

    if (!ngram_printer) {
        print_all(token_printer, sort_and_filter(token_counter.release(), opts.token_min));
        return;
    }

    const ranked_list tokens = opts.filter_first ? sort_and_filter(token_counter.release(), opts.token_min)
                                                 : sort_and_filter(token_counter.release());
    print_all(token_printer, tokens);

    frequency_counter ngram_counter;
    for (const auto& kv : tokens) {
        const std::string token = opts.bracket ? bracketed(kv.first) : kv.first;
        ngram_counter.add_all(ngrams(token, opts.min_n, opts.max_n), kv.second);
    }
    if (opts.verbose) {
        log << "Expanded " << tokens.size() << " tokens into "
            << ngram_counter.size() << " distinct n-grams." << std::endl;
    }

    print_all(*ngram_printer, sort_and_filter(ngram_counter.release(), opts.ngram_min));
}

template <class ResultPrinter>
void count_corpus(std::istream& corpus,
                  ResultPrinter& token_printer,
                  const count_options& opts,
                  std::ostream& log)
{
    count_corpus(corpus, token_printer, boost::optional<ResultPrinter&>(), opts, log);
}

template <class ResultPrinter>
void count_corpus(std::istream& corpus,
                  ResultPrinter& token_printer,
                  ResultPrinter& ngram_printer,
                  const count_options& opts,
                  std::ostream& log)
{
    count_corpus(corpus, token_printer, boost::optional<ResultPrinter&>(ngram_printer), opts, log);
}

}  // namespace ccount


#endif  /* CCOUNT_PIPELINE_HPP */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <boost/timer/timer.hpp>
#include "cmdline.h"

#include "ccount/pipeline.hpp"
#include "ccount/printers.hpp"

#include "config.h"


template <class ResultPrinter>
void do_rest_of_counting(std::istream& corpus, ResultPrinter& token_printer, ResultPrinter* ngram_printer, const ccount::count_options& opts) {
    if (ngram_printer) {
        ccount::count_corpus(corpus, token_printer, *ngram_printer, opts, std::cerr);
    }
    else {
        ccount::count_corpus(corpus, token_printer, opts, std::cerr);
    }
}

int run(int argc, char* argv[]) {
    using namespace std;

    boost::timer::cpu_timer timer;

    // command line
    cmdline::parser p;
    p.set_program_name(APP_NAME);
    p.add("help", 'h', "print this message");
    p.add("version", 'V', "print version");
    p.add<string>("corpus", 'c', "corpus file (default: standard input)", false);
    p.add<string>("token-counts", 't', "token count file (default: standard output)", false);
    p.add<string>("ngram-counts", 'n', "n-gram count file; enables n-gram counting", false);
    p.add<int>("token-min", 0, "minimum token count; only applies to the token list with --filter-first when counting n-grams",
               false, 1, cmdline::range(0, numeric_limits<int>::max()));
    p.add<int>("ngram-min", 0, "minimum n-gram count",
               false, 1, cmdline::range(0, numeric_limits<int>::max()));
    p.add<int>("min-n", 0, "minimum n-gram length",
               false, 3, cmdline::range(0, numeric_limits<int>::max()));
    p.add<int>("max-n", 0, "maximum n-gram length",
               false, 6, cmdline::range(0, numeric_limits<int>::max()));
    p.add("filter-first", 0, "filter tokens by --token-min before counting n-grams");
    p.add("no-bracket", 0, "do not wrap tokens in '<' and '>' before counting n-grams");
    p.add<string>("format", 0,
                  "one of: tsv, json-lines",
                  false, "tsv",
                  cmdline::oneof<string>("tsv", "json-lines"));
    p.add("header", 0, "print a header line (tsv only)");
    p.add("verbose", 'v', "report progress on standard error");
    if (!p.parse(argc, argv)) {
        cerr << p.error_full() << p.usage();
        return EXIT_FAILURE;
    }
    else if (p.exist("help")) {
        cout << p.usage();
        return EXIT_SUCCESS;
    }
    else if (p.exist("version")) {
        cout << APP_NAME " " APP_VERSION << endl;
        return EXIT_SUCCESS;
    }

    ccount::count_options opts;
    opts.token_min    = p.get<int>("token-min");
    opts.ngram_min    = p.get<int>("ngram-min");
    opts.min_n        = p.get<int>("min-n");
    opts.max_n        = p.get<int>("max-n");
    opts.filter_first = p.exist("filter-first");
    opts.bracket      = !p.exist("no-bracket");
    opts.verbose      = p.exist("verbose");
    try {
        ccount::validate(opts);
    }
    catch (const invalid_argument& e) {
        cerr << e.what() << "\n" << p.usage();
        return EXIT_FAILURE;
    }

    // turn off the synchronization of iostream and cstdio.
    ios::sync_with_stdio(false);

    // input
    ifstream corpus_file;
    istream* corpus = &cin;
    if (p.exist("corpus")) {
        corpus_file.open(p.get<string>("corpus"));
        if (!corpus_file)  throw runtime_error("Can't open corpus for reading.");
        corpus = &corpus_file;
    }

    // outputs
    ofstream token_file;
    ostream* token_os = &cout;
    if (p.exist("token-counts")) {
        token_file.open(p.get<string>("token-counts"));
        if (!token_file)  throw runtime_error("Can't open output to write token counts.");
        token_os = &token_file;
    }
    ofstream ngram_file;
    if (p.exist("ngram-counts")) {
        ngram_file.open(p.get<string>("ngram-counts"));
        if (!ngram_file)  throw runtime_error("Can't create file to write ngram counts.");
    }
    const bool count_ngrams = p.exist("ngram-counts");

    if (p.get<string>("format") == "tsv") {
        ccount::tsv_count_printer token_printer(*token_os, p.exist("header"));
        ccount::tsv_count_printer ngram_printer(ngram_file, p.exist("header"));
        do_rest_of_counting(*corpus, token_printer, count_ngrams ? &ngram_printer : nullptr, opts);
    }
    else if (p.get<string>("format") == "json-lines") {
        ccount::json_lines_count_printer token_printer(*token_os);
        ccount::json_lines_count_printer ngram_printer(ngram_file);
        do_rest_of_counting(*corpus, token_printer, count_ngrams ? &ngram_printer : nullptr, opts);
    }
    else {
        throw runtime_error("Unsupported output format is specified.");
    }

    if (opts.verbose) {
        cerr << timer.format(boost::timer::default_places, "%w s wall, %u s user, %s s system") << endl;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << APP_NAME << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}

/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests of token and n-gram counting over in-memory streams
 */

#include <gtest/gtest.h>
#include <ccount/pipeline.hpp>
#include <ccount/printers.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace ccount;

namespace {

struct Outputs {
    std::string tokens;
    std::string ngrams;
    std::string log;
};

Outputs run_tokens(const std::string& corpus, const count_options& opts) {
    std::istringstream is(corpus);
    std::ostringstream token_os, log_os;
    tsv_count_printer token_printer(token_os);
    count_corpus(is, token_printer, opts, log_os);
    return Outputs{token_os.str(), std::string(), log_os.str()};
}

Outputs run_combined(const std::string& corpus, const count_options& opts) {
    std::istringstream is(corpus);
    std::ostringstream token_os, ngram_os, log_os;
    tsv_count_printer token_printer(token_os);
    tsv_count_printer ngram_printer(ngram_os);
    count_corpus(is, token_printer, ngram_printer, opts, log_os);
    return Outputs{token_os.str(), ngram_os.str(), log_os.str()};
}

count_options ngram_options(std::size_t min_n, std::size_t max_n) {
    count_options opts;
    opts.min_n = min_n;
    opts.max_n = max_n;
    return opts;
}

}  // namespace

// ============================================================================
// Token-only mode
// ============================================================================

TEST(PipelineTest, CountsTokens) {
    const Outputs out = run_tokens("a a b", count_options());
    EXPECT_EQ(out.tokens, "a\t2\nb\t1\n");
    EXPECT_EQ(out.log, "");
}

TEST(PipelineTest, TokenMinAlwaysAppliesWithoutNGrams) {
    count_options opts;
    opts.token_min = 2;
    EXPECT_EQ(run_tokens("x x y z z z", opts).tokens, "z\t3\nx\t2\n");
}

TEST(PipelineTest, TokensAcrossLines) {
    EXPECT_EQ(run_tokens("b a\n\na  b\nb\n", count_options()).tokens, "b\t3\na\t2\n");
}

// ============================================================================
// Combined mode
// ============================================================================

TEST(PipelineTest, BracketedNGrams) {
    const Outputs out = run_combined("ab", ngram_options(1, 2));
    EXPECT_EQ(out.tokens, "ab\t1\n");
    EXPECT_EQ(out.ngrams, "<\t1\n<a\t1\n>\t1\na\t1\nab\t1\nb\t1\nb>\t1\n");
}

TEST(PipelineTest, UnbracketedNGrams) {
    count_options opts = ngram_options(1, 2);
    opts.bracket = false;
    EXPECT_EQ(run_combined("ab", opts).ngrams, "a\t1\nab\t1\nb\t1\n");
}

TEST(PipelineTest, NGramsWeightedByTokenCount) {
    count_options opts = ngram_options(1, 1);
    opts.bracket = false;
    const Outputs out = run_combined("aa aa b", opts);
    EXPECT_EQ(out.tokens, "aa\t2\nb\t1\n");
    EXPECT_EQ(out.ngrams, "a\t4\nb\t1\n");
}

TEST(PipelineTest, FilterFirstRestrictsTokensAndNGrams) {
    count_options opts = ngram_options(1, 1);
    opts.token_min = 2;
    opts.filter_first = true;
    const Outputs out = run_combined("x x y", opts);
    EXPECT_EQ(out.tokens, "x\t2\n");
    EXPECT_EQ(out.ngrams, "<\t2\n>\t2\nx\t2\n");
}

TEST(PipelineTest, WithoutFilterFirstTokenMinIsIgnored) {
    count_options opts = ngram_options(1, 1);
    opts.token_min = 2;
    const Outputs out = run_combined("x x y", opts);
    EXPECT_EQ(out.tokens, "x\t2\ny\t1\n");
    EXPECT_EQ(out.ngrams, "<\t3\n>\t3\nx\t2\ny\t1\n");
}

TEST(PipelineTest, NGramMinFiltersNGrams) {
    count_options opts = ngram_options(2, 3);
    opts.ngram_min = 2;
    opts.bracket = false;
    const Outputs out = run_combined("abc abd", opts);
    EXPECT_EQ(out.tokens, "abc\t1\nabd\t1\n");
    EXPECT_EQ(out.ngrams, "ab\t2\n");
}

TEST(PipelineTest, TokensShorterThanMinNContributeNothing) {
    const Outputs out = run_combined("a bb", ngram_options(5, 6));
    EXPECT_EQ(out.tokens, "a\t1\nbb\t1\n");
    EXPECT_EQ(out.ngrams, "");
}

TEST(PipelineTest, MultiByteTokens) {
    // U+00E4 occurs in both tokens
    count_options opts = ngram_options(1, 1);
    opts.bracket = false;
    const Outputs out = run_combined("\xC3\xA4x \xC3\xA4x y\xC3\xA4", opts);
    EXPECT_EQ(out.tokens, "\xC3\xA4x\t2\ny\xC3\xA4\t1\n");
    EXPECT_EQ(out.ngrams, "\xC3\xA4\t3\nx\t2\ny\t1\n");
}

TEST(PipelineTest, IdenticalRunsProduceIdenticalOutput) {
    const std::string corpus = "the cat sat on the mat\nthe dog sat\n";
    const count_options opts = ngram_options(2, 4);
    const Outputs first = run_combined(corpus, opts);
    const Outputs second = run_combined(corpus, opts);
    EXPECT_EQ(first.tokens, second.tokens);
    EXPECT_EQ(first.ngrams, second.ngrams);
}

// ============================================================================
// Configuration and logging
// ============================================================================

TEST(PipelineTest, RejectsInvalidLengths) {
    EXPECT_THROW(validate(ngram_options(0, 3)), std::invalid_argument);
    EXPECT_THROW(validate(ngram_options(4, 3)), std::invalid_argument);
    EXPECT_NO_THROW(validate(ngram_options(3, 3)));
    EXPECT_THROW(run_combined("abc", ngram_options(0, 3)), std::invalid_argument);
}

TEST(PipelineTest, InvalidConfigurationProducesNoOutput) {
    std::istringstream is("abc");
    std::ostringstream token_os, log_os;
    tsv_count_printer token_printer(token_os);
    EXPECT_THROW(count_corpus(is, token_printer, ngram_options(4, 3), log_os), std::invalid_argument);
    EXPECT_EQ(token_os.str(), "");
}

TEST(PipelineTest, VerboseReportsProgress) {
    count_options opts = ngram_options(1, 1);
    opts.verbose = true;
    const Outputs out = run_combined("a a b", opts);
    EXPECT_NE(out.log.find("Read 3 tokens, 2 distinct."), std::string::npos);
    EXPECT_NE(out.log.find("Expanded 2 tokens into 4 distinct n-grams."), std::string::npos);
}

TEST(PipelineTest, JsonLinesOutput) {
    std::istringstream is("a a b");
    std::ostringstream token_os, log_os;
    json_lines_count_printer token_printer(token_os);
    count_corpus(is, token_printer, count_options(), log_os);
    EXPECT_EQ(token_os.str(), "{\"count\":2,\"string\":\"a\"}\n{\"count\":1,\"string\":\"b\"}\n");
}

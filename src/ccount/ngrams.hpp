#ifndef CCOUNT_NGRAMS_HPP
#define CCOUNT_NGRAMS_HPP

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/iterator/iterator_facade.hpp>
#include <boost/utility/string_view.hpp>


namespace ccount {

// Character n-grams of a UTF-8 string.
//
// For every start character i, the n-grams beginning at i are enumerated from
// the longest (min(max_n, remaining characters)) down to min_n before moving
// on to i + 1.  The enumeration stops at the first start position that has
// fewer than min_n characters left.
//
// Elements are views into the input string, which must outlive this object
// and every view obtained from it.
struct ngrams {
private:
    struct ngram_iterator;

public:
    using value_type     = boost::string_view;
    using iterator       = ngram_iterator;
    using const_iterator = ngram_iterator;

    ngrams(const std::string& input, const std::size_t min_n, const std::size_t max_n)
        : input_(input), min_n_(min_n), max_n_(max_n), offsets_()
    {
        if (min_n_ == 0) {
            throw std::invalid_argument("The minimum n-gram length cannot be zero.");
        }
        if (min_n_ > max_n_) {
            throw std::invalid_argument("The maximum length should be equal to or greater than the minimum length.");
        }

        // byte offset of every character, i.e. of every non-continuation byte.
        offsets_.reserve(input_.size());
        for (std::size_t i = 0; i < input_.size(); ++i) {
            if ((static_cast<unsigned char>(input_[i]) & 0xC0) != 0x80) {
                offsets_.push_back(i);
            }
        }
    }

    iterator begin() const { return anchored_at(0); }
    iterator end()   const { return iterator(this, num_chars(), 0); }

    std::size_t size() const {
        std::size_t n = 0;
        for (std::size_t i = 0; i + min_n_ <= num_chars(); ++i) {
            n += std::min(max_n_, num_chars() - i) - min_n_ + 1;
        }
        return n;
    }

    bool empty() const { return num_chars() < min_n_; }

    std::size_t num_chars() const { return offsets_.size(); }
    std::size_t min_n() const { return min_n_; }
    std::size_t max_n() const { return max_n_; }

private:
    struct ngram_iterator
        : public boost::iterator_facade<
            ngram_iterator,
            boost::string_view,
            boost::forward_traversal_tag,
            boost::string_view>
    {
        ngram_iterator()
            : parent_(0), i_(0), len_(0)
        {}

        ngram_iterator(const ngrams* parent, std::size_t i, std::size_t len)
            : parent_(parent), i_(i), len_(len)
        {}

    private:
        friend class boost::iterator_core_access;

        void increment() {
            --len_;
            if (len_ < parent_->min_n_) {
                // all n-grams at i_ are done; drop the leading character.
                *this = parent_->anchored_at(i_ + 1);
            }
        }

        bool equal(const ngram_iterator& other) const {
            return this->parent_ == other.parent_
                && this->i_ == other.i_
                && this->len_ == other.len_;
        }

        boost::string_view dereference() const {
            const auto& offsets = parent_->offsets_;
            const std::size_t first = offsets[i_];
            const std::size_t last  = i_ + len_ == offsets.size() ? parent_->input_.size()
                                                                  : offsets[i_ + len_];
            return boost::string_view(parent_->input_.data() + first, last - first);
        }

        const ngrams* parent_;
        std::size_t i_;
        std::size_t len_;
    };

    iterator anchored_at(const std::size_t i) const {
        if (i > num_chars() || num_chars() - i < min_n_) {
            return end();
        }
        return iterator(this, i, std::min(max_n_, num_chars() - i));
    }

    const std::string& input_;
    const std::size_t min_n_;
    const std::size_t max_n_;
    std::vector<std::size_t> offsets_;
};

}  // namespace ccount


#endif  /* CCOUNT_NGRAMS_HPP */

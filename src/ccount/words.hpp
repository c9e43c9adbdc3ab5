#ifndef CCOUNT_WORDS_HPP
#define CCOUNT_WORDS_HPP

#include <cstddef>
#include <utility>
#include <vector>
#include <boost/iterator/iterator_facade.hpp>
#include <boost/range/begin.hpp>
#include <boost/range/end.hpp>
#include <boost/range/iterator.hpp>
#include <boost/range/iterator_range.hpp>


namespace ccount {

// Maximal runs of characters satisfying a predicate.
template <class RandomAccessRange>
struct words {
    using range_type = RandomAccessRange;
    using word_type  = boost::iterator_range<typename boost::range_const_iterator<RandomAccessRange>::type>;

private:
    struct word_iterator;

public:
    using iterator       = word_iterator;
    using const_iterator = word_iterator;

    template <class Pred>
    words(const RandomAccessRange& input, Pred is_word_char)
        : input_(input), poslens_()
    {
        bool within_word = false;
        for (auto it = boost::const_begin(input_);
             it != boost::const_end(input_);
             ++it)
        {
            if (!within_word) {
                if (is_word_char(*it)) {
                    within_word = true;
                    const std::size_t pos = it - boost::const_begin(input_);
                    poslens_.emplace_back(pos, 1);
                }
            }
            else {
                if (is_word_char(*it)) {
                    ++poslens_.back().second;
                }
                else {
                    within_word = false;
                }
            }
        }
    }

    iterator begin() const { return iterator(this, poslens_.begin()); }
    iterator end()   const { return iterator(this, poslens_.end()); }

    std::size_t size() const { return poslens_.size(); }
    bool empty() const { return poslens_.empty(); }

private:
    using poslens_type = std::vector<std::pair<std::size_t, std::size_t>>;

    struct word_iterator
        : public boost::iterator_facade<
            word_iterator,
            word_type,
            boost::random_access_traversal_tag,
            word_type,
            std::ptrdiff_t>
    {
        word_iterator()
            : parent_(0), it_()
        {}

        word_iterator(const words* parent, const typename poslens_type::const_iterator& it)
            : parent_(parent), it_(it)
        {}

    private:
        friend class boost::iterator_core_access;

        void increment() { ++it_; }
        void decrement() { --it_; }
        void advance(std::ptrdiff_t n) { it_ += n; }

        std::ptrdiff_t distance_to(const word_iterator& other) const {
            return other.it_ - this->it_;
        }

        bool equal(const word_iterator& other) const {
            return this->parent_ == other.parent_
                && this->it_ == other.it_;
        }

        word_type dereference() const {
            const auto first = boost::const_begin(parent_->input_) + it_->first;
            return word_type(first, first + it_->second);
        }

        const words* parent_;
        typename poslens_type::const_iterator it_;
    };

    const RandomAccessRange& input_;
    poslens_type poslens_;
};

template <class RandomAccessRange, class Pred>
words<RandomAccessRange> make_words(const RandomAccessRange& input, Pred is_word_char) {
    return words<RandomAccessRange>(input, is_word_char);
}

}  // namespace ccount


#endif  /* CCOUNT_WORDS_HPP */

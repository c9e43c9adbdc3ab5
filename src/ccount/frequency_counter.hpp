#ifndef CCOUNT_FREQUENCY_COUNTER_HPP
#define CCOUNT_FREQUENCY_COUNTER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <boost/utility/string_view.hpp>


namespace ccount {

using count_type = std::uint64_t;
using count_map  = std::unordered_map<std::string, count_type>;

struct frequency_counter {
    frequency_counter()
        : counts_(), total_(0)
    {}

    void add(const boost::string_view s, const count_type weight = 1) {
        counts_[std::string(s.data(), s.size())] += weight;
        total_ += weight;
    }

    // Credits every element of the range with the same weight.
    template <class SinglePassRange>
    void add_all(const SinglePassRange& r, const count_type weight = 1) {
        for (const auto& s : r) {
            add(s, weight);
        }
    }

    count_type count(const boost::string_view s) const {
        const auto it = counts_.find(std::string(s.data(), s.size()));
        return it == counts_.end() ? 0 : it->second;
    }

    const count_map& counts() const { return counts_; }
    std::size_t size() const { return counts_.size(); }
    count_type total() const { return total_; }

    count_map release() {
        count_map released;
        released.swap(counts_);
        total_ = 0;
        return released;
    }

private:
    count_map counts_;
    count_type total_;
};

}  // namespace ccount


#endif  /* CCOUNT_FREQUENCY_COUNTER_HPP */

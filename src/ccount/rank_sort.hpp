#ifndef CCOUNT_RANK_SORT_HPP
#define CCOUNT_RANK_SORT_HPP

#include <algorithm>
#include <string>
#include <utility>
#include <vector>
#include <boost/optional/optional.hpp>
#include "ccount/frequency_counter.hpp"


namespace ccount {

using ranked_list = std::vector<std::pair<std::string, count_type>>;

// Orders entries by descending count, then by ascending string.  std::string
// compares bytes as unsigned char, so UTF-8 keys end up in code point order.
// Entries whose count is below min_count are dropped.
inline ranked_list sort_and_filter(count_map counts, const boost::optional<count_type>& min_count = boost::none) {
    ranked_list items;
    items.reserve(counts.size());
    for (const auto& kv : counts) {
        if (min_count && kv.second < *min_count) {
            continue;
        }
        items.emplace_back(kv.first, kv.second);
    }
    counts.clear();

    std::sort(items.begin(), items.end(),
              [](const ranked_list::value_type& a, const ranked_list::value_type& b) {
                  if (a.second != b.second) {
                      return a.second > b.second;
                  }
                  return a.first < b.first;
              });

    return items;
}

}  // namespace ccount


#endif  /* CCOUNT_RANK_SORT_HPP */

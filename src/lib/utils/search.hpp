#ifndef UTILS_SEARCH_HPP
#define UTILS_SEARCH_HPP

#include <cstddef>
#include <vector>

// This namespace contain functions to perform search on data structures.
namespace Search {

// Returns the index of the first element of the haystack, sorted by key, whose
// key is not less than the needle. If all keys are smaller, haystack.size() is
// returned.
template <class T>
struct KeySort {
    std::size_t index;
    T sorting_key;
};
template <typename T>
std::size_t lower_bound(const std::vector<KeySort<T>> &haystack, T needle) {
    std::size_t l = 0;
    std::size_t r = haystack.size();
    while (l < r) {
        std::size_t mid = l + ((r - l) / 2);
        if (haystack[mid].sorting_key < needle) {
            l = mid + 1;
        } else {
            r = mid;
        }
    }
    return l;
}

}  // namespace Search

#endif /* UTILS_SEARCH_HPP */

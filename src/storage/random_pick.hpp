#pragma once

#include <cstddef>
#include <iterator>

namespace memkv {

// Picks a random element of a non-empty std::unordered_* container.
//
// Chooses a random non-empty bucket, then a random element inside it:
// O(1) on average, not perfectly uniform when chains differ in length.
// Sparse tables (after mass deletion) fall back to a linear walk so the
// bucket probe never spins.
template <typename Container, typename Rng>
[[nodiscard]] const typename Container::value_type&
random_element(const Container& c, Rng& rng) {
    const std::size_t buckets = c.bucket_count();
    if (c.size() * 8 < buckets) {
        auto it = c.begin();
        std::advance(it, static_cast<std::ptrdiff_t>(rng() % c.size()));
        return *it;
    }

    std::size_t b = 0;
    do {
        b = rng() % buckets;
    } while (c.bucket_size(b) == 0);

    auto local = c.begin(b);
    std::advance(local, static_cast<std::ptrdiff_t>(rng() % c.bucket_size(b)));
    return *local;
}

} // namespace memkv

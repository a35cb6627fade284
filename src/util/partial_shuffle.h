#pragma once

#include <random>
#include <utility>

// Shuffles the last shuffle_count elements of the container, drawing each one
// from the not yet shuffled prefix. Shuffling all elements gives a uniform
// permutation.
template<class T, class F>
void partial_shuffle(T& container, std::size_t shuffle_count, F& rand)
{
    typedef typename std::uniform_int_distribution<std::size_t> distr_t;
    typedef typename distr_t::param_type param_t;

    if (container.size() < 2)
        return;

    if (shuffle_count > container.size() - 1)
        shuffle_count = container.size() - 1;

    distr_t d;

    for (auto i = container.size() - 1; i >= container.size() - shuffle_count; --i)
        std::swap(container[i], container[d(rand, param_t(0, i))]);
}

#pragma once

/**
 * @file ExecutionPolicies.hpp
 * @brief Execution policy tags for row/column and per-scope loops
 *
 * ParallelPolicy runs loops through tbb::parallel_for; SequentialPolicy
 * runs them in order on the calling thread (used by tests and --threads 1).
 */

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace popaccess {

struct SequentialPolicy {};
struct ParallelPolicy {};

/**
 * @brief Apply body(i) for i in [begin, end) under the given policy
 */
template<typename Body>
void for_each_index(SequentialPolicy, std::size_t begin, std::size_t end, const Body& body) {
    for (std::size_t i = begin; i < end; ++i) {
        body(i);
    }
}

template<typename Body>
void for_each_index(ParallelPolicy, std::size_t begin, std::size_t end, const Body& body) {
    tbb::parallel_for(tbb::blocked_range<std::size_t>(begin, end),
        [&body](const tbb::blocked_range<std::size_t>& range) {
            for (std::size_t i = range.begin(); i != range.end(); ++i) {
                body(i);
            }
        });
}

} // namespace popaccess

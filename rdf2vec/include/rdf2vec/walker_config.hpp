#ifndef RDF2VEC_WALKER_CONFIG_HPP
#define RDF2VEC_WALKER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

namespace rdf2vec {

/**
 * Parameters of Weisfeiler-Lehman walk extraction.
 */
struct WalkerConfig {
    // Number of (predicate, object) hops per walk
    std::size_t depth = 4;

    // Maximum number of walks sampled per root; unset keeps every walk
    std::optional<std::size_t> walks_per_graph;

    // Relabeling rounds after the initial naming round
    std::size_t wl_iterations = 4;

    // Seed of the walk sampler
    std::uint64_t seed = 42;

    // 1 runs on the calling thread, 0 uses hardware concurrency
    std::size_t num_threads = 1;

    // Throws std::invalid_argument on an unusable configuration
    void validate() const;
};

} // namespace rdf2vec

#endif // RDF2VEC_WALKER_CONFIG_HPP

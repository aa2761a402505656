#ifndef RDF2VEC_RANDOM_WALKER_HPP
#define RDF2VEC_RANDOM_WALKER_HPP

#include <rdf2vec/graph.hpp>
#include <rdf2vec/walk.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace rdf2vec {

/**
 * Enumerates the walks of up to `depth` (predicate, object) hops from a root
 * and samples at most `walks_per_graph` of them.
 *
 * Sampling is uniform without replacement and only depends on the generator
 * passed in, so a fixed seed reproduces the same walks.
 */
class RandomWalker {
private:
    std::size_t depth_;
    std::optional<std::size_t> walks_per_graph_;

    std::vector<Walk> sample(std::vector<Walk> walks, std::mt19937_64& rng) const;

public:
    RandomWalker(std::size_t depth, std::optional<std::size_t> walks_per_graph)
        : depth_(depth), walks_per_graph_(walks_per_graph) {}

    /**
     * Walks rooted at root, each at most 2*depth+1 vertices long.
     * A root without outgoing hops gives the single walk [root]; a root the
     * graph does not contain gives no walks.
     */
    std::vector<Walk> extract_walks(const GraphAccessor& graph, const Vertex& root,
                                    std::mt19937_64& rng) const;

    std::vector<Walk> extract_walks(const GraphAccessor& graph, const Vertex& root,
                                    std::uint64_t seed) const {
        std::mt19937_64 rng(seed);
        return extract_walks(graph, root, rng);
    }
};

} // namespace rdf2vec

#endif // RDF2VEC_RANDOM_WALKER_HPP

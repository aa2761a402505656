#include <rdf2vec/random_walker.hpp>
#include <rdf2vec/debug_log.hpp>
#include <algorithm>
#include <numeric>

namespace rdf2vec {

std::vector<Walk> RandomWalker::extract_walks(const GraphAccessor& graph, const Vertex& root,
                                              std::mt19937_64& rng) const {
    if (!graph.contains(root)) {
        RDF2VEC_DEBUG_LOG(WALK, "root '%s' not in graph, no walks", root.name().c_str());
        return {};
    }

    std::vector<Walk> walks = {Walk{root}};

    for (std::size_t d = 0; d < depth_; ++d) {
        std::vector<Walk> next_walks;
        bool extended = false;

        for (auto& walk : walks) {
            // Only walks that reached the previous depth can grow
            if (walk.size() != 2 * d + 1) {
                next_walks.push_back(std::move(walk));
                continue;
            }

            std::vector<Hop> hops = graph.hops(walk.back());
            for (const auto& [pred, obj] : hops) {
                Walk longer = walk;
                longer.push_back(pred);
                longer.push_back(obj);
                next_walks.push_back(std::move(longer));
            }
            if (!hops.empty()) {
                extended = true;
            } else {
                next_walks.push_back(std::move(walk));
            }
        }

        walks = std::move(next_walks);
        if (!extended) {
            break;
        }
    }

    RDF2VEC_DEBUG_LOG(WALK, "root '%s': %zu walks before sampling", root.name().c_str(), walks.size());
    return sample(std::move(walks), rng);
}

std::vector<Walk> RandomWalker::sample(std::vector<Walk> walks, std::mt19937_64& rng) const {
    if (!walks_per_graph_ || walks.size() <= *walks_per_graph_) {
        return walks;
    }

    // Partial Fisher-Yates over indices, then restore generation order
    const std::size_t count = *walks_per_graph_;
    std::vector<std::size_t> indices(walks.size());
    std::iota(indices.begin(), indices.end(), 0);
    for (std::size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<std::size_t> dist(i, indices.size() - 1);
        std::swap(indices[i], indices[dist(rng)]);
    }
    indices.resize(count);
    std::sort(indices.begin(), indices.end());

    std::vector<Walk> sampled;
    sampled.reserve(count);
    for (std::size_t idx : indices) {
        sampled.push_back(std::move(walks[idx]));
    }
    return sampled;
}

} // namespace rdf2vec

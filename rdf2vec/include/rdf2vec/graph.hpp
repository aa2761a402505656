#ifndef RDF2VEC_GRAPH_HPP
#define RDF2VEC_GRAPH_HPP

#include <rdf2vec/vertex.hpp>
#include <utility>
#include <vector>

namespace rdf2vec {

using Hop = std::pair<Vertex, Vertex>;  // (predicate, object)

/**
 * Read-only view of a knowledge graph consumed by the walkers.
 *
 * Implementations must return neighbor sequences in a stable order and must
 * not be mutated while an extraction is running. Lookups of vertices the
 * graph does not contain return empty sequences.
 */
class GraphAccessor {
public:
    virtual ~GraphAccessor() = default;

    virtual std::vector<Vertex> all_vertices() const = 0;

    // Outgoing neighbors
    virtual std::vector<Vertex> neighbors(const Vertex& v) const = 0;

    // Incoming neighbors, used for relabeling
    virtual std::vector<Vertex> inverse_neighbors(const Vertex& v) const = 0;

    virtual bool contains(const Vertex& v) const = 0;

    // (predicate, object) pairs two steps away from v, in neighbor order
    std::vector<Hop> hops(const Vertex& v) const;
};

} // namespace rdf2vec

#endif // RDF2VEC_GRAPH_HPP

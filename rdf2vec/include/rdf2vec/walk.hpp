#ifndef RDF2VEC_WALK_HPP
#define RDF2VEC_WALK_HPP

#include <rdf2vec/vertex.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rdf2vec {

// Root first, then alternating predicate and entity vertices
using Walk = std::vector<Vertex>;

/**
 * One walk at one relabeling round: even positions hold vertex names, odd
 * positions hold the round label of the vertex at that hop.
 */
struct CanonicalWalk {
    std::vector<std::string> hops;

    CanonicalWalk() = default;
    explicit CanonicalWalk(std::vector<std::string> h) : hops(std::move(h)) {}

    bool operator==(const CanonicalWalk& other) const {
        return hops == other.hops;
    }

    bool operator!=(const CanonicalWalk& other) const {
        return !(*this == other);
    }

    bool operator<(const CanonicalWalk& other) const {
        return hops < other.hops;
    }

    std::string to_string() const;
};

struct CanonicalWalkHash {
    std::size_t operator()(const CanonicalWalk& walk) const;
};

using CanonicalWalkSet = std::unordered_set<CanonicalWalk, CanonicalWalkHash>;

// Set contents in lexicographic order
std::vector<CanonicalWalk> sorted_walks(const CanonicalWalkSet& walks);

} // namespace rdf2vec

#endif // RDF2VEC_WALK_HPP

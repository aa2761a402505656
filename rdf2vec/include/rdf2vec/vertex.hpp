#ifndef RDF2VEC_VERTEX_HPP
#define RDF2VEC_VERTEX_HPP

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rdf2vec {

using VertexId = std::size_t;

constexpr VertexId INVALID_VERTEX = std::numeric_limits<std::size_t>::max();

class VertexRegistry;

/**
 * Immutable knowledge graph node.
 *
 * Entity vertices are interned by name: two entities with the same name are
 * equal whatever their ids. Predicate vertices carry positional identity and
 * only equal another predicate with the same (id, previous, next, name).
 * Ordering looks at the name alone, so it does not agree with equality for
 * predicates.
 *
 * previous/next are ids into the VertexRegistry that created the vertex,
 * resolved through VertexRegistry::previous_of / next_of.
 */
class Vertex {
private:
    std::string name_;
    bool is_predicate_ = false;
    VertexId previous_ = INVALID_VERTEX;
    VertexId next_ = INVALID_VERTEX;
    VertexId id_ = INVALID_VERTEX;

    Vertex(VertexId id, std::string name, bool is_predicate, VertexId previous, VertexId next)
        : name_(std::move(name))
        , is_predicate_(is_predicate)
        , previous_(previous)
        , next_(next)
        , id_(id) {}

    friend class VertexRegistry;

public:
    const std::string& name() const { return name_; }
    bool is_predicate() const { return is_predicate_; }
    VertexId id() const { return id_; }

    bool has_previous() const { return previous_ != INVALID_VERTEX; }
    bool has_next() const { return next_ != INVALID_VERTEX; }
    VertexId previous_id() const { return previous_; }
    VertexId next_id() const { return next_; }

    bool operator==(const Vertex& other) const {
        if (is_predicate_ != other.is_predicate_) {
            return false;
        }
        if (is_predicate_) {
            return id_ == other.id_ && previous_ == other.previous_ &&
                   next_ == other.next_ && name_ == other.name_;
        }
        return name_ == other.name_;
    }

    bool operator!=(const Vertex& other) const {
        return !(*this == other);
    }

    bool operator<(const Vertex& other) const {
        return name_ < other.name_;
    }

    std::size_t hash() const;
};

/**
 * Issues vertex ids for one graph and keeps every vertex it created so that
 * predicate back-references can be resolved. Ids start at 0 for every
 * registry.
 */
class VertexRegistry {
private:
    std::vector<Vertex> vertices_;  // indexed by id

public:
    VertexRegistry() = default;

    /**
     * Create a vertex with a fresh id.
     * Throws std::invalid_argument if previous/next are given for an entity
     * vertex or name an id this registry never issued.
     */
    Vertex create(const std::string& name, bool is_predicate = false,
                  std::optional<VertexId> previous = std::nullopt,
                  std::optional<VertexId> next = std::nullopt);

    std::optional<Vertex> find(VertexId id) const;
    std::optional<Vertex> previous_of(const Vertex& v) const;
    std::optional<Vertex> next_of(const Vertex& v) const;

    bool issued(VertexId id) const { return id < vertices_.size(); }
    std::size_t size() const { return vertices_.size(); }
};

} // namespace rdf2vec

namespace std {
    template<>
    struct hash<rdf2vec::Vertex> {
        std::size_t operator()(const rdf2vec::Vertex& v) const {
            return v.hash();
        }
    };
}

#endif // RDF2VEC_VERTEX_HPP

#include <rdf2vec/vertex.hpp>
#include <stdexcept>

namespace rdf2vec {

namespace {

// boost::hash_combine mixing step
inline void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

std::size_t Vertex::hash() const {
    std::size_t name_hash = std::hash<std::string>{}(name_);
    if (!is_predicate_) {
        return name_hash;
    }
    std::size_t seed = std::hash<VertexId>{}(id_);
    hash_combine(seed, std::hash<VertexId>{}(previous_));
    hash_combine(seed, std::hash<VertexId>{}(next_));
    hash_combine(seed, name_hash);
    return seed;
}

Vertex VertexRegistry::create(const std::string& name, bool is_predicate,
                              std::optional<VertexId> previous,
                              std::optional<VertexId> next) {
    if (!is_predicate && (previous || next)) {
        throw std::invalid_argument("Entity vertex '" + name + "' cannot have previous/next references");
    }
    if (previous && !issued(*previous)) {
        throw std::invalid_argument("Unknown previous vertex id " + std::to_string(*previous));
    }
    if (next && !issued(*next)) {
        throw std::invalid_argument("Unknown next vertex id " + std::to_string(*next));
    }

    VertexId id = vertices_.size();
    Vertex vertex(id, name, is_predicate,
                  previous.value_or(INVALID_VERTEX), next.value_or(INVALID_VERTEX));
    vertices_.push_back(vertex);
    return vertex;
}

std::optional<Vertex> VertexRegistry::find(VertexId id) const {
    if (!issued(id)) {
        return std::nullopt;
    }
    return vertices_[id];
}

std::optional<Vertex> VertexRegistry::previous_of(const Vertex& v) const {
    return v.has_previous() ? find(v.previous_id()) : std::nullopt;
}

std::optional<Vertex> VertexRegistry::next_of(const Vertex& v) const {
    return v.has_next() ? find(v.next_id()) : std::nullopt;
}

} // namespace rdf2vec

#include <rdf2vec/knowledge_graph.hpp>
#include <rdf2vec/debug_log.hpp>
#include <algorithm>
#include <stdexcept>

namespace rdf2vec {

namespace {
constexpr std::size_t NOT_FOUND = static_cast<std::size_t>(-1);
}

std::size_t KnowledgeGraph::index_of(const Vertex& v) const {
    auto it = vertex_index_.find(v);
    return (it != vertex_index_.end()) ? it->second : NOT_FOUND;
}

std::size_t KnowledgeGraph::ensure_vertex(const Vertex& v) {
    std::size_t idx = index_of(v);
    if (idx != NOT_FOUND) {
        return idx;
    }

    auto own = registry_.find(v.id());
    bool issued_here = own && own->is_predicate() == v.is_predicate() &&
                       own->id() == v.id() && own->name() == v.name();

    if (v.is_predicate() && !issued_here) {
        throw std::invalid_argument("Predicate vertex '" + v.name() + "' was not created by this graph");
    }

    // Entities from another registry are re-issued here so that every id
    // stored in this graph resolves through registry_
    Vertex local = issued_here ? v : registry_.create(v.name());

    idx = vertices_.size();
    vertices_.push_back(local);
    vertex_index_.emplace(local, idx);
    out_edges_.emplace_back();
    in_edges_.emplace_back();
    if (!local.is_predicate()) {
        entities_.emplace(local.name(), local);
    }
    return idx;
}

bool KnowledgeGraph::add_vertex(const Vertex& v) {
    std::size_t before = vertices_.size();
    ensure_vertex(v);
    return vertices_.size() != before;
}

bool KnowledgeGraph::add_edge(const Vertex& from, const Vertex& to) {
    std::size_t from_idx = ensure_vertex(from);
    std::size_t to_idx = ensure_vertex(to);

    auto& out = out_edges_[from_idx];
    if (std::find(out.begin(), out.end(), to) != out.end()) {
        return false;
    }
    out.push_back(vertices_[to_idx]);
    in_edges_[to_idx].push_back(vertices_[from_idx]);
    ++num_edges_;
    return true;
}

bool KnowledgeGraph::remove_edge(const Vertex& from, const Vertex& to) {
    std::size_t from_idx = index_of(from);
    std::size_t to_idx = index_of(to);
    if (from_idx == NOT_FOUND || to_idx == NOT_FOUND) {
        return false;
    }

    auto& out = out_edges_[from_idx];
    auto it = std::find(out.begin(), out.end(), to);
    if (it == out.end()) {
        return false;
    }
    out.erase(it);

    auto& in = in_edges_[to_idx];
    in.erase(std::find(in.begin(), in.end(), from));
    --num_edges_;
    return true;
}

Vertex KnowledgeGraph::add_entity(const std::string& name) {
    auto it = entities_.find(name);
    if (it != entities_.end()) {
        return it->second;
    }
    return vertices_[ensure_vertex(registry_.create(name))];
}

Vertex KnowledgeGraph::add_triple(const std::string& subject, const std::string& predicate,
                                  const std::string& object) {
    Vertex s = add_entity(subject);
    Vertex o = add_entity(object);
    Vertex p = registry_.create(predicate, true, s.id(), o.id());

    add_edge(s, p);
    add_edge(p, o);

    RDF2VEC_DEBUG_LOG(GRAPH, "triple (%s, %s, %s) -> predicate id %zu",
                      subject.c_str(), predicate.c_str(), object.c_str(), p.id());
    return p;
}

std::optional<Vertex> KnowledgeGraph::entity(const std::string& name) const {
    auto it = entities_.find(name);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Vertex> KnowledgeGraph::neighbors(const Vertex& v) const {
    std::size_t idx = index_of(v);
    return (idx != NOT_FOUND) ? out_edges_[idx] : std::vector<Vertex>{};
}

std::vector<Vertex> KnowledgeGraph::inverse_neighbors(const Vertex& v) const {
    std::size_t idx = index_of(v);
    return (idx != NOT_FOUND) ? in_edges_[idx] : std::vector<Vertex>{};
}

bool KnowledgeGraph::contains(const Vertex& v) const {
    return index_of(v) != NOT_FOUND;
}

} // namespace rdf2vec

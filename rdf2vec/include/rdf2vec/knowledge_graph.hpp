#ifndef RDF2VEC_KNOWLEDGE_GRAPH_HPP
#define RDF2VEC_KNOWLEDGE_GRAPH_HPP

#include <rdf2vec/graph.hpp>
#include <rdf2vec/vertex.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rdf2vec {

/**
 * In-memory directed knowledge graph.
 * Every triple (s, p, o) is stored as two edges s -> p -> o where p is a
 * fresh predicate vertex, so the same relation name used twice yields two
 * distinct predicate vertices. Entities are interned by name.
 * Vertices and neighbors are enumerated in insertion order.
 */
class KnowledgeGraph : public GraphAccessor {
private:
    VertexRegistry registry_;

    std::vector<Vertex> vertices_;
    std::unordered_map<Vertex, std::size_t> vertex_index_;
    std::unordered_map<std::string, Vertex> entities_;

    // Adjacency by position in vertices_
    std::vector<std::vector<Vertex>> out_edges_;
    std::vector<std::vector<Vertex>> in_edges_;
    std::size_t num_edges_ = 0;

    std::size_t index_of(const Vertex& v) const;
    std::size_t ensure_vertex(const Vertex& v);

public:
    KnowledgeGraph() = default;

    /**
     * Add a vertex. Returns false if an equal vertex is already present.
     * Throws std::invalid_argument for a predicate vertex created by another
     * registry.
     */
    bool add_vertex(const Vertex& v);

    // Add a directed edge, adding missing endpoints. Returns false for a duplicate edge.
    bool add_edge(const Vertex& from, const Vertex& to);

    bool remove_edge(const Vertex& from, const Vertex& to);

    // Intern an entity vertex by name
    Vertex add_entity(const std::string& name);

    /**
     * Add subject -> predicate -> object.
     * Returns the new predicate vertex.
     */
    Vertex add_triple(const std::string& subject, const std::string& predicate, const std::string& object);

    std::optional<Vertex> entity(const std::string& name) const;

    // GraphAccessor
    std::vector<Vertex> all_vertices() const override { return vertices_; }
    std::vector<Vertex> neighbors(const Vertex& v) const override;
    std::vector<Vertex> inverse_neighbors(const Vertex& v) const override;
    bool contains(const Vertex& v) const override;

    const VertexRegistry& registry() const { return registry_; }
    VertexRegistry& registry() { return registry_; }

    std::size_t num_vertices() const { return vertices_.size(); }
    std::size_t num_edges() const { return num_edges_; }
};

} // namespace rdf2vec

#endif // RDF2VEC_KNOWLEDGE_GRAPH_HPP

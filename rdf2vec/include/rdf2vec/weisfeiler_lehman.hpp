#ifndef RDF2VEC_WEISFEILER_LEHMAN_HPP
#define RDF2VEC_WEISFEILER_LEHMAN_HPP

#include <rdf2vec/graph.hpp>
#include <rdf2vec/job_types.hpp>
#include <rdf2vec/vertex.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace rdf2vec {

// vertex -> label per round, index 0 is the vertex name
using LabelMap = std::unordered_map<Vertex, std::vector<std::string>>;

// vertex -> label -> round it was produced in (last round wins)
using InverseLabelMap = std::unordered_map<Vertex, std::unordered_map<std::string, std::size_t>>;

struct WLResult {
    LabelMap labels;
    InverseLabelMap inverse_labels;

    // Throws std::out_of_range for an unknown vertex or round
    const std::string& label(const Vertex& v, std::size_t round) const {
        return labels.at(v).at(round);
    }
};

/**
 * Weisfeiler-Lehman relabeling over incoming edges.
 *
 * Round 0 labels every vertex with its name. Round n hashes the vertex's own
 * round n-1 label together with the sorted set of distinct round n-1 labels of
 * its inverse neighbors:
 *
 *     md5(own + "-" + join(sorted(set(neighbor labels)), "-"))
 *
 * so the result only depends on which labels occur, not on how often or in
 * which order the graph enumerates them. Rounds are separated by a barrier;
 * within a round vertices are independent and may run on a job system.
 */
class WeisfeilerLehman {
private:
    std::size_t wl_iterations_;
    ExtractionJobSystem* jobs_;  // non-owning, may be null

public:
    static constexpr char SEPARATOR = '-';

    explicit WeisfeilerLehman(std::size_t wl_iterations, ExtractionJobSystem* jobs = nullptr)
        : wl_iterations_(wl_iterations), jobs_(jobs) {}

    /**
     * Labels for rounds 0..wl_iterations of every vertex of graph.
     * Throws std::invalid_argument if an inverse neighbor is missing from
     * graph.all_vertices().
     */
    WLResult relabel(const GraphAccessor& graph) const;

    // Pre-digest string of one vertex in one round
    static std::string composite_label(const std::string& own_label,
                                       std::vector<std::string> neighbor_labels);

    std::size_t wl_iterations() const { return wl_iterations_; }
};

} // namespace rdf2vec

#endif // RDF2VEC_WEISFEILER_LEHMAN_HPP

#include <rdf2vec/weisfeiler_lehman.hpp>
#include <rdf2vec/digest.hpp>
#include <rdf2vec/debug_log.hpp>
#include <algorithm>
#include <stdexcept>

namespace rdf2vec {

namespace {

// Vertices per relabeling job
constexpr std::size_t RELABEL_BLOCK_SIZE = 256;

} // namespace

std::string WeisfeilerLehman::composite_label(const std::string& own_label,
                                              std::vector<std::string> neighbor_labels) {
    std::sort(neighbor_labels.begin(), neighbor_labels.end());
    neighbor_labels.erase(std::unique(neighbor_labels.begin(), neighbor_labels.end()),
                          neighbor_labels.end());

    std::string result = own_label;
    result += SEPARATOR;
    for (std::size_t i = 0; i < neighbor_labels.size(); ++i) {
        if (i > 0) result += SEPARATOR;
        result += neighbor_labels[i];
    }
    return result;
}

WLResult WeisfeilerLehman::relabel(const GraphAccessor& graph) const {
    const std::vector<Vertex> vertices = graph.all_vertices();
    const std::size_t num_vertices = vertices.size();

    std::unordered_map<Vertex, std::size_t> index;
    index.reserve(num_vertices);
    for (std::size_t i = 0; i < num_vertices; ++i) {
        index.emplace(vertices[i], i);
    }

    // Inverse adjacency by position, resolved once for all rounds
    std::vector<std::vector<std::size_t>> predecessors(num_vertices);
    for (std::size_t i = 0; i < num_vertices; ++i) {
        for (const Vertex& u : graph.inverse_neighbors(vertices[i])) {
            auto it = index.find(u);
            if (it == index.end()) {
                throw std::invalid_argument("Inverse neighbor '" + u.name() +
                                            "' of '" + vertices[i].name() + "' is not a graph vertex");
            }
            predecessors[i].push_back(it->second);
        }
    }

    // rounds[n][i] is the round-n label of vertices[i]
    std::vector<std::vector<std::string>> rounds(wl_iterations_ + 1,
                                                 std::vector<std::string>(num_vertices));
    for (std::size_t i = 0; i < num_vertices; ++i) {
        rounds[0][i] = vertices[i].name();
    }

    for (std::size_t n = 1; n <= wl_iterations_; ++n) {
        const auto& previous = rounds[n - 1];
        auto& current = rounds[n];

        auto relabel_range = [&previous, &current, &predecessors](std::size_t begin, std::size_t end) {
            for (std::size_t i = begin; i < end; ++i) {
                std::vector<std::string> neighbor_labels;
                neighbor_labels.reserve(predecessors[i].size());
                for (std::size_t p : predecessors[i]) {
                    neighbor_labels.push_back(previous[p]);
                }
                current[i] = md5_hex(composite_label(previous[i], std::move(neighbor_labels)));
            }
        };

        if (jobs_ && num_vertices > RELABEL_BLOCK_SIZE) {
            for (std::size_t begin = 0; begin < num_vertices; begin += RELABEL_BLOCK_SIZE) {
                std::size_t end = std::min(begin + RELABEL_BLOCK_SIZE, num_vertices);
                jobs_->submit_function([relabel_range, begin, end]() {
                    relabel_range(begin, end);
                }, ExtractionJobType::RELABEL);
            }
            // Round n+1 reads round n: barrier
            jobs_->wait_for_completion();
        } else {
            relabel_range(0, num_vertices);
        }

        RDF2VEC_DEBUG_LOG(RELABEL, "WL round %zu relabeled %zu vertices", n, num_vertices);
    }

    WLResult result;
    result.labels.reserve(num_vertices);
    result.inverse_labels.reserve(num_vertices);
    for (std::size_t i = 0; i < num_vertices; ++i) {
        std::vector<std::string> history;
        history.reserve(wl_iterations_ + 1);
        auto& inverse = result.inverse_labels[vertices[i]];
        for (std::size_t n = 0; n <= wl_iterations_; ++n) {
            history.push_back(rounds[n][i]);
            inverse[rounds[n][i]] = n;
        }
        result.labels[vertices[i]] = std::move(history);
    }
    return result;
}

} // namespace rdf2vec

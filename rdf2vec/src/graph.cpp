#include <rdf2vec/graph.hpp>

namespace rdf2vec {

std::vector<Hop> GraphAccessor::hops(const Vertex& v) const {
    std::vector<Hop> result;
    for (const Vertex& pred : neighbors(v)) {
        for (const Vertex& obj : neighbors(pred)) {
            result.emplace_back(pred, obj);
        }
    }
    return result;
}

} // namespace rdf2vec

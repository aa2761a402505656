#include <rdf2vec/walker_config.hpp>
#include <stdexcept>
#include <string>

namespace rdf2vec {

namespace {

// Each round costs one digest per vertex
constexpr std::size_t MAX_WL_ITERATIONS = 64;

} // namespace

void WalkerConfig::validate() const {
    if (depth == 0) {
        throw std::invalid_argument("depth must be at least 1");
    }
    if (walks_per_graph && *walks_per_graph == 0) {
        throw std::invalid_argument("walks_per_graph must be positive when set");
    }
    if (wl_iterations > MAX_WL_ITERATIONS) {
        throw std::invalid_argument("wl_iterations must not exceed " + std::to_string(MAX_WL_ITERATIONS));
    }
}

} // namespace rdf2vec

#include <rdf2vec/walk.hpp>
#include <algorithm>
#include <sstream>

namespace rdf2vec {

std::string CanonicalWalk::to_string() const {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < hops.size(); ++i) {
        oss << hops[i];
        if (i < hops.size() - 1) oss << " -> ";
    }
    oss << ")";
    return oss.str();
}

std::size_t CanonicalWalkHash::operator()(const CanonicalWalk& walk) const {
    std::size_t seed = walk.hops.size();
    for (const auto& hop : walk.hops) {
        seed ^= std::hash<std::string>{}(hop) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

std::vector<CanonicalWalk> sorted_walks(const CanonicalWalkSet& walks) {
    std::vector<CanonicalWalk> result(walks.begin(), walks.end());
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace rdf2vec

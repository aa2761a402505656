#include <rdf2vec/wl_walker.hpp>
#include <rdf2vec/debug_log.hpp>

namespace rdf2vec {

WLWalker::WLWalker(const WalkerConfig& config)
    : config_(config)
    , walker_(config.depth, config.walks_per_graph) {
    config_.validate();
    if (config_.num_threads != 1) {
        jobs_ = std::make_unique<ExtractionJobSystem>(config_.num_threads);
        jobs_->start();
    }
}

WLWalker::~WLWalker() {
    if (jobs_) {
        jobs_->shutdown();
    }
}

std::uint64_t WLWalker::instance_seed(std::size_t instance_index) const {
    return config_.seed ^ (static_cast<std::uint64_t>(instance_index) * 0x9e3779b97f4a7c15ULL);
}

void WLWalker::canonicalize(const std::vector<Walk>& walks, CanonicalWalkSet& out) const {
    for (std::size_t n = 0; n <= config_.wl_iterations; ++n) {
        for (const Walk& walk : walks) {
            std::vector<std::string> hops;
            hops.reserve(walk.size());
            for (std::size_t i = 0; i < walk.size(); ++i) {
                if (i % 2 == 0) {
                    hops.push_back(walk[i].name());
                } else {
                    hops.push_back(last_result_.label(walk[i], n));
                }
            }
            out.insert(CanonicalWalk(std::move(hops)));
        }
    }
}

void WLWalker::extract_instance(const GraphAccessor& graph, const std::string& instance,
                                std::size_t instance_index, CanonicalWalkSet& out) const {
    // Entities are interned by name, so a fresh vertex finds the graph's own
    VertexRegistry scratch;
    Vertex root = scratch.create(instance);

    std::vector<Walk> walks = walker_.extract_walks(graph, root, instance_seed(instance_index));
    canonicalize(walks, out);

    RDF2VEC_DEBUG_LOG(EXTRACT, "instance '%s': %zu walks, %zu canonical walks",
                      instance.c_str(), walks.size(), out.size());
}

CanonicalWalkSet WLWalker::extract(const GraphAccessor& graph, const std::vector<std::string>& instances) {
    WeisfeilerLehman relabeler(config_.wl_iterations, jobs_.get());
    last_result_ = relabeler.relabel(graph);

    CanonicalWalkSet canonical_walks;

    if (!jobs_) {
        for (std::size_t i = 0; i < instances.size(); ++i) {
            extract_instance(graph, instances[i], i, canonical_walks);
        }
    } else {
        // One output slot per instance, merged after the barrier
        std::vector<CanonicalWalkSet> per_instance(instances.size());
        for (std::size_t i = 0; i < instances.size(); ++i) {
            jobs_->submit_function([this, &graph, &instances, &per_instance, i]() {
                extract_instance(graph, instances[i], i, per_instance[i]);
            }, ExtractionJobType::WALK);
        }
        jobs_->wait_for_completion();

        for (auto& walks : per_instance) {
            canonical_walks.insert(walks.begin(), walks.end());
        }
    }

    RDF2VEC_DEBUG_LOG(EXTRACT, "extracted %zu canonical walks from %zu instances",
                      canonical_walks.size(), instances.size());
    return canonical_walks;
}

} // namespace rdf2vec

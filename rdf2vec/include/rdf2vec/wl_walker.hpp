#ifndef RDF2VEC_WL_WALKER_HPP
#define RDF2VEC_WL_WALKER_HPP

#include <rdf2vec/graph.hpp>
#include <rdf2vec/job_types.hpp>
#include <rdf2vec/random_walker.hpp>
#include <rdf2vec/walk.hpp>
#include <rdf2vec/walker_config.hpp>
#include <rdf2vec/weisfeiler_lehman.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rdf2vec {

/**
 * Weisfeiler-Lehman walk extraction.
 *
 * extract() relabels the whole graph once, samples walks from every instance
 * and writes each walk once per round, replacing the vertices at odd
 * positions with their round label. The union of all canonical walks is the
 * corpus handed to the embedding trainer.
 *
 * Every instance samples from its own generator derived from the seed and
 * the instance position, so results do not depend on num_threads.
 */
class WLWalker {
private:
    WalkerConfig config_;
    RandomWalker walker_;
    std::unique_ptr<ExtractionJobSystem> jobs_;  // null when single threaded
    WLResult last_result_;

    std::uint64_t instance_seed(std::size_t instance_index) const;

    void canonicalize(const std::vector<Walk>& walks, CanonicalWalkSet& out) const;

    void extract_instance(const GraphAccessor& graph, const std::string& instance,
                          std::size_t instance_index, CanonicalWalkSet& out) const;

public:
    // Throws std::invalid_argument for an invalid config
    explicit WLWalker(const WalkerConfig& config);
    ~WLWalker();

    WLWalker(const WLWalker&) = delete;
    WLWalker& operator=(const WLWalker&) = delete;

    /**
     * Canonical walks rooted at the entities named by instances.
     * Instances the graph does not contain contribute nothing.
     */
    CanonicalWalkSet extract(const GraphAccessor& graph, const std::vector<std::string>& instances);

    // Labels of the last extract() call
    const LabelMap& label_map() const { return last_result_.labels; }
    const InverseLabelMap& inverse_label_map() const { return last_result_.inverse_labels; }
};

} // namespace rdf2vec

#endif // RDF2VEC_WL_WALKER_HPP

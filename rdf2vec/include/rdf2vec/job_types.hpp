#ifndef RDF2VEC_JOB_TYPES_HPP
#define RDF2VEC_JOB_TYPES_HPP

#include <job_system/job_system.hpp>

namespace rdf2vec {

enum class ExtractionJobType {
    RELABEL,  // one block of vertices in one WL round
    WALK      // walks and canonical walks of one instance
};

using ExtractionJobSystem = job_system::JobSystem<ExtractionJobType>;

} // namespace rdf2vec

#endif // RDF2VEC_JOB_TYPES_HPP

#ifndef RDF2VEC_DIGEST_HPP
#define RDF2VEC_DIGEST_HPP

#include <cstddef>
#include <string>

namespace rdf2vec {

constexpr std::size_t DIGEST_HEX_LENGTH = 32;

/**
 * MD5 of the UTF-8 bytes of input, as 32 lowercase hex characters.
 * Stable across runs and platforms. Throws std::runtime_error if the
 * OpenSSL digest backend fails.
 */
std::string md5_hex(const std::string& input);

} // namespace rdf2vec

#endif // RDF2VEC_DIGEST_HPP

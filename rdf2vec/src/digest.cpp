#include <rdf2vec/digest.hpp>
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace rdf2vec {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // namespace

std::string md5_hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_length) != 1) {
        throw std::runtime_error("MD5 digest computation failed");
    }

    std::string result;
    result.reserve(hash_length * 2);
    for (unsigned int i = 0; i < hash_length; ++i) {
        result.push_back(HEX_DIGITS[hash[i] >> 4]);
        result.push_back(HEX_DIGITS[hash[i] & 0x0F]);
    }
    return result;
}

} // namespace rdf2vec

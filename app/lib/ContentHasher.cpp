#include "ContentHasher.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <openssl/evp.h>

using ErrorCodes::Code;

void ContentHasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const
{
    EVP_MD_CTX_free(ctx);
}


ContentHasher::ContentHasher()
    : ctx(EVP_MD_CTX_new())
{
    if (!ctx) {
        THROW_APP_ERROR(Code::SYSTEM_CRYPTO_FAILURE, "EVP_MD_CTX_new");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        THROW_APP_ERROR(Code::SYSTEM_CRYPTO_FAILURE, "EVP_DigestInit_ex(md5)");
    }
}


ContentHasher::~ContentHasher() = default;


void ContentHasher::update(const void* data, std::size_t size)
{
    if (finalized) {
        THROW_APP_ERROR_MSG(Code::SYSTEM_CRYPTO_FAILURE, "Digest already finalized", "update");
    }
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        THROW_APP_ERROR(Code::SYSTEM_CRYPTO_FAILURE, "EVP_DigestUpdate");
    }
}


std::string ContentHasher::finalize_hex()
{
    if (finalized) {
        THROW_APP_ERROR_MSG(Code::SYSTEM_CRYPTO_FAILURE, "Digest already finalized", "finalize");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        THROW_APP_ERROR(Code::SYSTEM_CRYPTO_FAILURE, "EVP_DigestFinal_ex");
    }
    finalized = true;
    return Utils::to_hex(digest, length);
}


std::string ContentHasher::hex_digest(const std::string& data)
{
    ContentHasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finalize_hex();
}

#ifndef CONTENT_HASHER_HPP
#define CONTENT_HASHER_HPP

#include <cstddef>
#include <memory>
#include <string>

struct evp_md_ctx_st;

/**
 * @brief Incremental MD5 digest over OpenSSL's EVP interface.
 *
 * Used as an equality fingerprint only, not for security. A hasher is
 * single use: after finalize_hex() it must not be updated again.
 */
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(const void* data, std::size_t size);
    std::string finalize_hex();

    static std::string hex_digest(const std::string& data);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx;
    bool finalized{false};
};

#endif

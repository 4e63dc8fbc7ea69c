#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <memory>

// Opaque OpenSSL digest context
struct evp_md_ctx_st;

namespace lorchestre::util {

/**
 * Digests used as identities across the catalog.
 *
 * Album identifiers, cover cache keys and the library fingerprint are all
 * lowercase hex MD5 digests, so the same (album, artist) pair always lands on
 * the same album and the same cover file.
 */
class ContentHasher {
public:
    // MD5 of the bytes, 32-char lowercase hex
    [[nodiscard]] static std::string md5_hex(std::string_view data);

    // md5(album ++ primary_artist), no separator between the two
    [[nodiscard]] static std::string album_id(std::string_view album, std::string_view primary_artist);

    // 128 random bits from getrandom(), 32-char hex
    [[nodiscard]] static std::string random_id();

    /**
     * Incremental MD5, used to hash a directory walk without keeping every
     * path in memory. hex() may be called once.
     */
    class Md5Stream {
    public:
        Md5Stream();
        ~Md5Stream();

        Md5Stream(const Md5Stream&) = delete;
        Md5Stream& operator=(const Md5Stream&) = delete;

        void update(std::string_view data);
        [[nodiscard]] std::string hex();

    private:
        struct CtxDeleter {
            void operator()(evp_md_ctx_st* ctx) const;
        };
        std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    };

private:
    static std::string to_hex(const uint8_t* bytes, size_t len);
};

}  // namespace lorchestre::util

#include "util/ContentHasher.hpp"
#include <openssl/evp.h>
#include <sys/random.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <cerrno>

namespace lorchestre::util {

std::string ContentHasher::to_hex(const uint8_t* bytes, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string ContentHasher::md5_hex(std::string_view data) {
    Md5Stream stream;
    stream.update(data);
    return stream.hex();
}

std::string ContentHasher::album_id(std::string_view album, std::string_view primary_artist) {
    Md5Stream stream;
    stream.update(album);
    stream.update(primary_artist);
    return stream.hex();
}

std::string ContentHasher::random_id() {
    uint8_t bytes[16];
    size_t filled = 0;
    while (filled < sizeof(bytes)) {
        ssize_t n = getrandom(bytes + filled, sizeof(bytes) - filled, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("getrandom failed");
        }
        filled += static_cast<size_t>(n);
    }
    return to_hex(bytes, sizeof(bytes));
}

void ContentHasher::Md5Stream::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

ContentHasher::Md5Stream::Md5Stream() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("ContentHasher: MD5 initialisation failed");
    }
}

ContentHasher::Md5Stream::~Md5Stream() = default;

void ContentHasher::Md5Stream::update(std::string_view data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("ContentHasher: MD5 update failed");
    }
}

std::string ContentHasher::Md5Stream::hex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &len) != 1) {
        throw std::runtime_error("ContentHasher: MD5 finalisation failed");
    }
    return to_hex(digest, len);
}

}  // namespace lorchestre::util

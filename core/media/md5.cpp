#include "md5.hpp"

#include <openssl/evp.h>

#include <memory>

namespace lcdlink {
namespace media {

namespace {
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
}  // namespace

bool md5_hex(const std::vector<uint8_t> &data, std::string &digest, std::string &error) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        error = "EVP_MD_CTX_new failed";
        return false;
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        error = "MD5 digest failed";
        return false;
    }

    static const char kHex[] = "0123456789abcdef";
    digest.clear();
    digest.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        digest.push_back(kHex[md[i] >> 4]);
        digest.push_back(kHex[md[i] & 0x0F]);
    }
    return true;
}

}  // namespace media
}  // namespace lcdlink

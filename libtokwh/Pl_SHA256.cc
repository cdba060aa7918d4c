#include <tokwh/Pl_SHA256.hh>

#include <tokwh/TWUtil.hh>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>

static void
check_openssl(int status)
{
    if (status != 1) {
        // OpenSSL keeps a queue of errors; report the first (innermost) one.
        char buf[256] = "";
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        std::string what = "OpenSSL error: ";
        what += buf;
        throw std::runtime_error(what);
    }
    ERR_clear_error();
}

class Pl_SHA256::Members
{
  public:
    Members() :
        md_ctx(EVP_MD_CTX_new())
    {
        if (!md_ctx) {
            throw std::bad_alloc();
        }
    }
    Members(Members const&) = delete;
    ~Members()
    {
        EVP_MD_CTX_free(md_ctx);
    }

    EVP_MD_CTX* md_ctx;
    bool in_progress{false};
    unsigned char md_out[EVP_MAX_MD_SIZE];
    unsigned int md_len{0};
};

Pl_SHA256::Pl_SHA256(Pipeline* next) :
    Pipeline("sha256", next),
    m(std::make_unique<Members>())
{
}

Pl_SHA256::~Pl_SHA256() = default;

void
Pl_SHA256::write(unsigned char const* buf, size_t len)
{
    if (!m->in_progress) {
        check_openssl(EVP_MD_CTX_reset(m->md_ctx));
        check_openssl(EVP_DigestInit_ex(m->md_ctx, EVP_sha256(), nullptr));
        m->in_progress = true;
    }
    if (len) {
        check_openssl(EVP_DigestUpdate(m->md_ctx, buf, len));
    }
    if (next()) {
        next()->write(buf, len);
    }
}

void
Pl_SHA256::finish()
{
    if (next()) {
        next()->finish();
    }
    if (!m->in_progress) {
        // Digest of empty input
        check_openssl(EVP_MD_CTX_reset(m->md_ctx));
        check_openssl(EVP_DigestInit_ex(m->md_ctx, EVP_sha256(), nullptr));
    }
    check_openssl(EVP_DigestFinal_ex(m->md_ctx, m->md_out, &m->md_len));
    m->in_progress = false;
}

std::string
Pl_SHA256::getRawDigest()
{
    if (m->in_progress) {
        throw std::logic_error("digest requested for in-progress SHA256 Pipeline");
    }
    return {reinterpret_cast<char const*>(m->md_out), m->md_len};
}

std::string
Pl_SHA256::getHexDigest()
{
    return TWUtil::hex_encode(getRawDigest());
}

#include "signer.hpp"
#include "base64.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/pkcs7.h>
#include <openssl/x509.h>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>

namespace pass_sign {

// Drains the OpenSSL error queue into one line.
static std::string openssl_error() {
    std::string msg;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!msg.empty()) msg += "; ";
        msg += buf;
    }
    return msg.empty() ? "unknown OpenSSL error" : msg;
}

// ── S/MIME → DER ──────────────────────────────────────────────────────────────

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<uint8_t> smime_to_der(const std::string& smime) {
    auto begin = smime.find(kSmimeMarker);
    if (begin == std::string::npos)
        throw SigningError("S/MIME output has no smime.p7s part");
    begin += std::strlen(kSmimeMarker);

    auto end = smime.find(kBoundaryMarker, begin);
    if (end == std::string::npos)
        throw SigningError("S/MIME output has no closing boundary");

    std::string body = trim(smime.substr(begin, end - begin));
    if (body.empty())
        throw SigningError("S/MIME signature part is empty");

    try {
        return base64_decode(body);
    } catch (const std::invalid_argument& e) {
        throw SigningError(std::string("S/MIME signature part: ") + e.what());
    }
}

// ── Credentials ───────────────────────────────────────────────────────────────

// Leaf key + certificate from the PKCS#12 and the trust-chain certificate.
// Owns all OpenSSL objects.
struct Credentials {
    EVP_PKEY*       key   = nullptr;
    X509*           cert  = nullptr;
    STACK_OF(X509)* ca    = nullptr;   // whatever else the PKCS#12 carried; unused
    STACK_OF(X509)* chain = nullptr;   // just the trust-chain certificate

    Credentials() = default;
    Credentials(const Credentials&) = delete;
    Credentials& operator=(const Credentials&) = delete;

    ~Credentials() {
        sk_X509_pop_free(chain, X509_free);
        sk_X509_pop_free(ca, X509_free);
        X509_free(cert);
        EVP_PKEY_free(key);
    }
};

static void load_pkcs12(Credentials& cred,
                        const std::string& path,
                        const std::string& password)
{
    std::vector<uint8_t> der;
    try {
        der = read_file(path);
    } catch (const std::runtime_error&) {
        throw CertificateError("The certificate at \"" + path + "\" could not be read");
    }
    if (der.empty())
        throw CertificateError("The certificate at \"" + path + "\" could not be read");

    BIO* bio = BIO_new_mem_buf(der.data(), static_cast<int>(der.size()));
    if (!bio)
        throw SigningError("BIO_new_mem_buf failed: " + openssl_error());

    PKCS12* p12 = d2i_PKCS12_bio(bio, nullptr);
    BIO_free(bio);
    if (!p12)
        throw CertificateError("Invalid certificate file: \"" + path + "\": " + openssl_error());

    int ok = PKCS12_parse(p12, password.c_str(), &cred.key, &cred.cert, &cred.ca);
    PKCS12_free(p12);
    if (ok != 1)
        throw CertificateError("Invalid certificate file or password: \"" + path + "\": " +
                               openssl_error());
    if (!cred.key || !cred.cert)
        throw CertificateError("Certificate file \"" + path + "\" has no key or certificate");
}

// PEM first; Apple distributes the WWDR certificate as DER (.cer) too.
static X509* read_x509(const std::vector<uint8_t>& data) {
    BIO* bio = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    if (!bio) return nullptr;
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    if (!cert) {
        ERR_clear_error();
        (void)BIO_reset(bio);
        cert = d2i_X509_bio(bio, nullptr);
    }
    BIO_free(bio);
    return cert;
}

static void load_wwdr(Credentials& cred, const std::string& path) {
    struct stat st;
    if (path.empty() || ::stat(path.c_str(), &st) != 0)
        throw CertificateError("The WWDR certificate at \"" + path + "\" could not be read");

    std::vector<uint8_t> data;
    try {
        data = read_file(path);
    } catch (const std::runtime_error&) {
        throw CertificateError("The WWDR certificate at \"" + path + "\" could not be read");
    }

    X509* wwdr = read_x509(data);
    if (!wwdr)
        throw CertificateError("The WWDR certificate at \"" + path + "\" is not a certificate: " +
                               openssl_error());

    cred.chain = sk_X509_new_null();
    if (!cred.chain || !sk_X509_push(cred.chain, wwdr)) {
        X509_free(wwdr);
        throw SigningError("sk_X509_push failed: " + openssl_error());
    }
}

// ── Signing ───────────────────────────────────────────────────────────────────

// PKCS7_sign + SMIME_write_PKCS7, exactly the detached binary S/MIME form
// the extraction step expects.
static std::string sign_smime(const Credentials& cred, const std::vector<uint8_t>& content) {
    const int flags = PKCS7_BINARY | PKCS7_DETACHED;

    BIO* in = BIO_new_mem_buf(content.data(), static_cast<int>(content.size()));
    if (!in)
        throw SigningError("BIO_new_mem_buf failed: " + openssl_error());

    PKCS7* p7 = PKCS7_sign(cred.cert, cred.key, cred.chain, in, flags);
    BIO_free(in);
    if (!p7)
        throw SigningError("PKCS7_sign failed: " + openssl_error());

    // The detached content is written again as the first MIME part.
    BIO* data = BIO_new_mem_buf(content.data(), static_cast<int>(content.size()));
    BIO* out  = BIO_new(BIO_s_mem());
    if (!data || !out) {
        BIO_free(data);
        BIO_free(out);
        PKCS7_free(p7);
        throw SigningError("BIO allocation failed: " + openssl_error());
    }

    int ok = SMIME_write_PKCS7(out, p7, data, flags);
    PKCS7_free(p7);
    BIO_free(data);
    if (ok != 1) {
        BIO_free(out);
        throw SigningError("SMIME_write_PKCS7 failed: " + openssl_error());
    }

    char* buf = nullptr;
    long len = BIO_get_mem_data(out, &buf);
    std::string smime(buf, static_cast<size_t>(len));
    BIO_free(out);
    return smime;
}

void sign_manifest(const std::string& manifest_path,
                   const std::string& signature_path,
                   const std::string& certificate_path,
                   const std::string& password,
                   const std::string& wwdr_path)
{
    Credentials cred;
    load_pkcs12(cred, certificate_path, password);
    load_wwdr(cred, wwdr_path);

    std::vector<uint8_t> content;
    try {
        content = read_file(manifest_path);
    } catch (const std::runtime_error& e) {
        throw IoError(e.what());
    }

    std::string smime = sign_smime(cred, content);

    // Intermediate S/MIME file, then overwritten in place with the DER form.
    try {
        write_file(signature_path, smime);
        std::vector<uint8_t> der = smime_to_der(read_file_text(signature_path));
        write_file(signature_path, der);
    } catch (const SigningError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw IoError(e.what());
    }
}

} // namespace pass_sign

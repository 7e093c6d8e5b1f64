#include "signer.hpp"
#include "errors.hpp"
#include "factory.hpp"
#include "file_io.hpp"
#include "verify.hpp"
#include "zip_archive.hpp"
#include "test_util.hpp"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/pkcs7.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

// ── Throwaway credentials ─────────────────────────────────────────────────────
// A "WWDR" CA and a leaf issued by it, generated fresh for every run.

static X509* make_cert(const char* cn, EVP_PKEY* subject_key,
                       X509* issuer, EVP_PKEY* issuer_key, long serial)
{
    X509* x = X509_new();
    if (!x) throw std::runtime_error("X509_new failed");
    X509_set_version(x, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x), serial);
    X509_gmtime_adj(X509_getm_notBefore(x), 0);
    X509_gmtime_adj(X509_getm_notAfter(x), 60L * 60 * 24);
    X509_set_pubkey(x, subject_key);

    X509_NAME* name = X509_get_subject_name(x);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(cn), -1, -1, 0);
    X509_set_issuer_name(x, issuer ? X509_get_subject_name(issuer) : name);

    if (X509_sign(x, issuer_key, EVP_sha256()) <= 0) {
        X509_free(x);
        throw std::runtime_error("X509_sign failed");
    }
    return x;
}

struct TestCredentials {
    std::string p12_path;
    std::string wwdr_path;
    std::string password = "correct horse battery staple";
    X509*       leaf = nullptr;

    ~TestCredentials() { X509_free(leaf); }
};

static void make_credentials(TestCredentials& tc, const std::string& dir) {
    EVP_PKEY* ca_key   = EVP_RSA_gen(2048);
    EVP_PKEY* leaf_key = EVP_RSA_gen(2048);
    if (!ca_key || !leaf_key)
        throw std::runtime_error("RSA key generation failed");

    X509* ca = make_cert("Test WWDR CA", ca_key, nullptr, ca_key, 1);
    tc.leaf  = make_cert("Pass Type ID: pass.com.example.test", leaf_key, ca, ca_key, 2);

    PKCS12* p12 = PKCS12_create(tc.password.c_str(), "pass", leaf_key, tc.leaf,
                                nullptr, 0, 0, 0, 0, 0);
    if (!p12)
        throw std::runtime_error("PKCS12_create failed");

    tc.p12_path  = dir + "/cert.p12";
    tc.wwdr_path = dir + "/wwdr.pem";

    BIO* out = BIO_new_file(tc.p12_path.c_str(), "wb");
    if (!out || i2d_PKCS12_bio(out, p12) != 1)
        throw std::runtime_error("cannot write " + tc.p12_path);
    BIO_free(out);

    out = BIO_new_file(tc.wwdr_path.c_str(), "w");
    if (!out || PEM_write_bio_X509(out, ca) != 1)
        throw std::runtime_error("cannot write " + tc.wwdr_path);
    BIO_free(out);

    PKCS12_free(p12);
    X509_free(ca);
    EVP_PKEY_free(leaf_key);
    EVP_PKEY_free(ca_key);
}

template <typename F>
static bool throws_certificate_error(F&& f) {
    try {
        f();
    } catch (const CertificateError&) {
        return true;
    }
    return false;
}

int main() {
    std::string dir = make_temp_dir();
    TestCredentials tc;
    try {
        make_credentials(tc, dir);
    } catch (const std::exception& e) {
        check(false, std::string("credential setup: ") + e.what());
        return finish();
    }

    const std::string manifest_json = "{\n    \"pass.json\": \"da39a3ee5e6b4b0d3255bfef95601890afd80709\"\n}";
    write_bytes(dir + "/manifest.json", manifest_json);
    std::string sig_path = dir + "/signature";

    // Detached DER signature over the manifest bytes
    try {
        pass_sign::sign_manifest(dir + "/manifest.json", sig_path,
                                 tc.p12_path, tc.password, tc.wwdr_path);
    } catch (const std::exception& e) {
        check(false, std::string("sign_manifest threw: ") + e.what());
        return finish();
    }

    std::vector<uint8_t> der = read_file(sig_path);
    check(!der.empty() && der[0] == 0x30, "signature file is a DER SEQUENCE");
    check(read_file_text(sig_path).find("smime.p7s") == std::string::npos,
          "S/MIME wrapper removed");

    const unsigned char* p = der.data();
    PKCS7* p7 = d2i_PKCS7(nullptr, &p, static_cast<long>(der.size()));
    check(p7 != nullptr, "signature parses as PKCS#7");
    if (p7) {
        check(PKCS7_type_is_signed(p7), "signedData content type");
        check(PKCS7_get_detached(p7) == 1, "content is detached");
        check(sk_X509_num(p7->d.sign->cert) == 2, "leaf + trust-chain certificate embedded");

        BIO* data = BIO_new_mem_buf(manifest_json.data(), static_cast<int>(manifest_json.size()));
        check(PKCS7_verify(p7, nullptr, nullptr, data, nullptr,
                           PKCS7_BINARY | PKCS7_NOVERIFY) == 1,
              "signature verifies over manifest bytes");
        BIO_free(data);

        STACK_OF(X509)* signers = PKCS7_get0_signers(p7, nullptr, 0);
        check(signers && sk_X509_num(signers) == 1 &&
              X509_cmp(sk_X509_value(signers, 0), tc.leaf) == 0,
              "signed by the leaf certificate");
        sk_X509_free(signers);

        std::string other = manifest_json + " ";
        data = BIO_new_mem_buf(other.data(), static_cast<int>(other.size()));
        check(PKCS7_verify(p7, nullptr, nullptr, data, nullptr,
                           PKCS7_BINARY | PKCS7_NOVERIFY) != 1,
              "signature rejects modified manifest");
        BIO_free(data);
        PKCS7_free(p7);
    }

    // Credential failures
    check(throws_certificate_error([&] {
        pass_sign::sign_manifest(dir + "/manifest.json", sig_path, tc.p12_path, "wrong", tc.wwdr_path);
    }), "wrong password -> CertificateError");

    check(throws_certificate_error([&] {
        pass_sign::sign_manifest(dir + "/manifest.json", sig_path, dir + "/absent.p12",
                                 tc.password, tc.wwdr_path);
    }), "missing PKCS#12 -> CertificateError");

    write_bytes(dir + "/garbage.p12", "this is not a PKCS#12 file");
    check(throws_certificate_error([&] {
        pass_sign::sign_manifest(dir + "/manifest.json", sig_path, dir + "/garbage.p12",
                                 tc.password, tc.wwdr_path);
    }), "garbage PKCS#12 -> CertificateError");

    check(throws_certificate_error([&] {
        pass_sign::sign_manifest(dir + "/manifest.json", sig_path, tc.p12_path,
                                 tc.password, dir + "/absent.pem");
    }), "missing WWDR -> CertificateError");

    // Whole pipeline, signed
    {
        std::string src = make_temp_dir();
        std::string tmp = make_temp_dir();
        std::string out = make_temp_dir();
        write_bytes(src + "/icon.png", fake_png("icon"));

        FactoryConfig cfg;
        cfg.temp_dir    = tmp;
        cfg.output_dir  = out;
        cfg.certificate = tc.p12_path;
        cfg.password    = tc.password;
        cfg.wwdr        = tc.wwdr_path;

        Pass pass = make_pass(PassType::StoreCard, "SIGNED-1");
        pass.images.push_back(make_image(src + "/icon.png"));

        try {
            std::string archive = pass_factory::create(pass, cfg);
            bool has_sig = false;
            for (const auto& e : zip_archive::read_archive(archive))
                has_sig = has_sig || e.name == "signature";
            check(has_sig, "signed bundle carries signature");

            auto report = pass_verify::verify_archive(archive);
            check(report.ok() && report.is_signed, "verifier accepts signed bundle");
            check(!path_exists(tmp + "/SIGNED-1"), "scratch removed after signed run");
        } catch (const std::exception& e) {
            check(false, std::string("signed create threw: ") + e.what());
        }

        // Same pass, bad password: scratch still cleaned up
        cfg.password = "nope";
        check(throws_certificate_error([&] { pass_factory::create(pass, cfg); }),
              "create with wrong password -> CertificateError");
        check(!path_exists(tmp + "/SIGNED-1"), "scratch removed after certificate failure");

        remove_tree(src);
        remove_tree(tmp);
        remove_tree(out);
    }

    remove_tree(dir);
    return finish();
}

#include "verify.hpp"
#include "manifest.hpp"
#include "signer.hpp"
#include "zip_archive.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pkcs7.h>
#include <openssl/x509.h>
#include <map>
#include <stdexcept>

namespace pass_verify {

// PKCS7_verify over the detached manifest bytes, no chain building.
static bool signature_matches(const std::vector<uint8_t>& der,
                              const std::vector<uint8_t>& content,
                              std::string& why)
{
    const unsigned char* p = der.data();
    PKCS7* p7 = d2i_PKCS7(nullptr, &p, static_cast<long>(der.size()));
    if (!p7) {
        why = "signature is not DER PKCS#7";
        ERR_clear_error();
        return false;
    }

    BIO* data = BIO_new_mem_buf(content.data(), static_cast<int>(content.size()));
    if (!data) {
        PKCS7_free(p7);
        why = "BIO_new_mem_buf failed";
        return false;
    }

    int rc = PKCS7_verify(p7, nullptr, nullptr, data, nullptr,
                          PKCS7_BINARY | PKCS7_NOVERIFY);
    BIO_free(data);
    PKCS7_free(p7);
    if (rc != 1) {
        why = "signature does not verify against manifest.json";
        ERR_clear_error();
        return false;
    }
    return true;
}

Report verify_archive(const std::string& path) {
    Report report;

    std::map<std::string, std::vector<uint8_t>> files;
    for (auto& entry : zip_archive::read_archive(path)) {
        if (!entry.is_directory)
            files[entry.name] = std::move(entry.data);
    }

    auto mf = files.find(manifest::kManifestFile);
    if (mf == files.end()) {
        report.problems.push_back("manifest.json is missing");
        return report;
    }

    manifest::Manifest listed;
    try {
        listed = manifest::parse(std::string(mf->second.begin(), mf->second.end()));
    } catch (const std::runtime_error& e) {
        report.problems.push_back(e.what());
        return report;
    }

    for (const auto& [name, digest] : listed) {
        auto it = files.find(name);
        if (it == files.end()) {
            report.problems.push_back(name + ": listed in manifest but not in archive");
            continue;
        }
        if (manifest::sha1_hex(it->second) != digest)
            report.problems.push_back(name + ": SHA-1 does not match manifest");
        ++report.files;
    }

    for (const auto& [name, data] : files) {
        if (name == manifest::kManifestFile || name == pass_sign::kSignatureFile)
            continue;
        if (!listed.count(name))
            report.problems.push_back(name + ": not listed in manifest");
    }

    auto sig = files.find(pass_sign::kSignatureFile);
    if (sig != files.end()) {
        report.is_signed = true;
        std::string why;
        if (!signature_matches(sig->second, mf->second, why))
            report.problems.push_back(why);
    }

    return report;
}

} // namespace pass_verify

#include "manifest.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "signer.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <stdexcept>

namespace manifest {

std::string sha1_hex(const std::vector<uint8_t>& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int  md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("SHA-1 digest failed");

    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out += kHex[md[i] >> 4];
        out += kHex[md[i] & 0x0F];
    }
    return out;
}

Manifest build(const std::string& dir) {
    Manifest m;
    std::string root = dir;
    if (!root.empty() && root.back() != '/')
        root += '/';

    for (const auto& entry : walk_tree(dir)) {
        if (entry.is_directory) continue;
        if (entry.relative == kManifestFile || entry.relative == pass_sign::kSignatureFile)
            continue;
        try {
            m[entry.relative] = sha1_hex(read_file(root + entry.relative));
        } catch (const std::runtime_error& e) {
            throw IoError(std::string("Cannot hash bundle file: ") + e.what());
        }
    }
    return m;
}

std::string to_json(const Manifest& m) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [path, digest] : m)
        j[path] = digest;
    try {
        return j.dump(4);
    } catch (const nlohmann::json::type_error& e) {
        throw IoError(std::string("manifest.json: ") + e.what());
    }
}

Manifest parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("manifest: ") + e.what());
    }
    if (!j.is_object())
        throw std::runtime_error("manifest: top-level value must be an object");

    Manifest m;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string())
            throw std::runtime_error("manifest: value for '" + it.key() + "' is not a string");
        m[it.key()] = it.value().get<std::string>();
    }
    return m;
}

Manifest write_manifest(const std::string& dir) {
    Manifest m = build(dir);
    std::string path = dir;
    if (!path.empty() && path.back() != '/')
        path += '/';
    path += kManifestFile;
    try {
        write_file(path, to_json(m));
    } catch (const std::runtime_error& e) {
        throw IoError(e.what());
    }
    return m;
}

} // namespace manifest

#include "config.hpp"
#include "errors.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <string>

namespace config {

FactoryConfig defaults() {
    FactoryConfig cfg;
    const char* tmp = std::getenv("TMPDIR");
    cfg.temp_dir = (tmp && *tmp) ? tmp : "/tmp";
    return cfg;
}

static std::string dir_of(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? "" : path.substr(0, slash + 1);
}

static std::string resolve(const std::string& base, const std::string& p) {
    if (p.empty() || p[0] == '/' || base.empty())
        return p;
    return base + p;
}

static std::string get_str(const YAML::Node& doc, const char* key, const std::string& fallback) {
    if (!doc[key])
        return fallback;
    try {
        return doc[key].as<std::string>();
    } catch (const YAML::Exception&) {
        throw DefinitionError(std::string("config: '") + key + "' must be a string");
    }
}

// Path values given in the file are relative to the file; fallbacks are not.
static std::string get_path(const YAML::Node& doc, const char* key, const std::string& base,
                            const std::string& fallback) {
    if (!doc[key])
        return fallback;
    return resolve(base, get_str(doc, key, fallback));
}

FactoryConfig load_config(const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw DefinitionError("Cannot load config " + path + ": " + e.what());
    }
    if (!doc.IsMap())
        throw DefinitionError("config " + path + ": top level must be a mapping");

    FactoryConfig cfg = defaults();
    std::string base = dir_of(path);

    cfg.temp_dir    = get_path(doc, "temp-dir",    base, cfg.temp_dir);
    cfg.output_dir  = get_path(doc, "output-dir",  base, cfg.output_dir);
    cfg.certificate = get_path(doc, "certificate", base, cfg.certificate);
    cfg.wwdr        = get_path(doc, "wwdr",        base, cfg.wwdr);
    cfg.password    = get_str(doc, "password", cfg.password);

    std::string env = get_str(doc, "password-env", "");
    if (!env.empty()) {
        const char* pw = std::getenv(env.c_str());
        if (!pw)
            throw DefinitionError("config: environment variable " + env + " is not set");
        cfg.password = pw;
    }

    if (doc["skip-signature"]) {
        try {
            cfg.skip_signature = doc["skip-signature"].as<bool>();
        } catch (const YAML::Exception&) {
            throw DefinitionError("config: 'skip-signature' must be true or false");
        }
    }

    return cfg;
}

} // namespace config

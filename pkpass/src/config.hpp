#pragma once
#include <string>

// Everything create() needs besides the pass itself. Passed by value /
// const reference into every call; nothing is kept between calls.
struct FactoryConfig {
    std::string temp_dir;           // scratch root; bundle built in <temp_dir>/<serial>/
    std::string output_dir = ".";
    std::string certificate;        // PKCS#12 with leaf certificate + key
    std::string password;
    std::string wwdr;               // trust-chain (WWDR) certificate, PEM or DER
    bool        skip_signature = false;
};

namespace config {

// temp_dir from $TMPDIR, else "/tmp"; everything else default.
FactoryConfig defaults();

// Reads a YAML mapping on top of defaults():
//
//   temp-dir:       /var/tmp/passes
//   output-dir:     /srv/passes
//   certificate:    certs/pass.p12
//   password:       secret            # or:
//   password-env:   PKPASS_PASSWORD   # name of an environment variable
//   wwdr:           certs/AppleWWDRCA.pem
//   skip-signature: false
//
// Relative paths are taken relative to the config file's directory.
// Throws DefinitionError on unreadable files or wrongly typed values.
FactoryConfig load_config(const std::string& path);

} // namespace config

#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace manifest {

static constexpr char kManifestFile[] = "manifest.json";

using Manifest = std::map<std::string, std::string>;   // relative path -> sha1 hex

// Lowercase hex SHA-1 of data.
std::string sha1_hex(const std::vector<uint8_t>& data);

// Hashes every regular file below dir, recursively. Keys are relative
// forward-slash paths ("de.lproj/pass.strings"). A top-level manifest.json
// or signature is never listed.
Manifest build(const std::string& dir);

// Pretty-printed JSON object, keys sorted.
std::string to_json(const Manifest& m);

// Inverse of to_json. Throws std::runtime_error if the text is not a JSON
// object of strings.
Manifest parse(const std::string& text);

// build() + write <dir>/manifest.json. Throws IoError.
Manifest write_manifest(const std::string& dir);

} // namespace manifest

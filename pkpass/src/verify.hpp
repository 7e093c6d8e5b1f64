#pragma once
#include <string>
#include <vector>

namespace pass_verify {

struct Report {
    size_t                   files = 0;        // entries covered by the manifest
    bool                     is_signed = false; // a signature entry is present
    std::vector<std::string> problems;         // empty means intact

    bool ok() const { return problems.empty(); }
};

// Checks a .pkpass archive: manifest.json must list exactly the archived
// files other than itself and the signature, with matching SHA-1s; a
// signature, if present, must be a DER PKCS#7 whose detached content is
// manifest.json and whose signer key verifies. Certificate trust is not
// evaluated.
//
// Throws ArchiveError if the archive cannot be read at all. Everything
// else is reported through Report::problems.
Report verify_archive(const std::string& path);

} // namespace pass_verify

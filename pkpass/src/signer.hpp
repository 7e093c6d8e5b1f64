#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Detached PKCS#7 signature over manifest.json.
//
// OpenSSL hands the signature back as an S/MIME multipart message; the
// pass container wants the bare DER blob, so the base64 body of the
// "smime.p7s" part is cut out and decoded.

namespace pass_sign {

static constexpr char kSignatureFile[]  = "signature";
static constexpr char kSmimeMarker[]    = "filename=\"smime.p7s\"";
static constexpr char kBoundaryMarker[] = "------";

// Extracts the DER signature from S/MIME text: the text after
// kSmimeMarker up to the next kBoundaryMarker, whitespace-trimmed and
// base64-decoded. Throws SigningError if a marker is missing or the body
// is not valid base64.
std::vector<uint8_t> smime_to_der(const std::string& smime);

// Signs manifest_path with the leaf certificate and key from the PKCS#12
// file, embedding the trust-chain certificate at wwdr_path, and writes
// the DER signature to signature_path.
//
// Throws CertificateError when the PKCS#12 is unreadable, the password is
// wrong, or the trust-chain file is missing or unparseable;
// SigningError for any other OpenSSL failure; IoError if the manifest
// cannot be read.
void sign_manifest(const std::string& manifest_path,
                   const std::string& signature_path,
                   const std::string& certificate_path,
                   const std::string& password,
                   const std::string& wwdr_path);

} // namespace pass_sign

#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Every stage of the bundle pipeline reports failure with one of these.
// All derive from std::runtime_error so callers that only care about
// "it failed" can catch that.

// Aggregated image-rule violations; thrown before anything touches disk.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(std::vector<std::string> errors)
        : std::runtime_error("Invalid pass"), errors_(std::move(errors)) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

class DirectoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// PKCS#12 unreadable or wrong password, trust-chain certificate missing.
class CertificateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SigningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed pass definition or configuration file.
class DefinitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A bundle file could not be read or written.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

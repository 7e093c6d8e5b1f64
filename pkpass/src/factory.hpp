#pragma once
#include "config.hpp"
#include "pass.hpp"
#include <optional>
#include <string>

namespace pass_factory {

static constexpr char kPassExtension[] = ".pkpass";

// Owns <temp_dir>/<serial>/ for one create() run. The constructor creates
// the directory, emptying it if it already exists; the destructor removes
// it and everything below it, on every exit path. Removal is best-effort.
class ScratchDir {
public:
    explicit ScratchDir(std::string path);
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// "<temp_dir>/<serial>"
std::string scratch_path(const Pass& pass, const FactoryConfig& cfg);

// "<output_dir>/<name or serial>.pkpass"
std::string output_path(const Pass& pass, const FactoryConfig& cfg,
                        const std::optional<std::string>& name);

// Builds, signs (unless cfg.skip_signature) and archives the pass; returns
// the path of the written .pkpass. Stages run strictly in order and the
// first failure aborts:
//
//   validate → scratch dir → pass.json → images → localizations
//            → manifest.json → signature → zip → scratch removed
//
// The serial number, the language codes and `name` must be plain file
// names; this is checked before anything touches disk.
//
// Throws ValidationError, DefinitionError (bad `name`), DirectoryError,
// IoError, CertificateError, SigningError or ArchiveError. Runs for
// distinct serial numbers may proceed concurrently; runs for the same
// serial must be serialized by the caller.
std::string create(const Pass& pass, const FactoryConfig& cfg,
                   const std::optional<std::string>& name = std::nullopt);

} // namespace pass_factory

#include "factory.hpp"
#include "bundle.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "manifest.hpp"
#include "signer.hpp"
#include "validator.hpp"
#include "zip_archive.hpp"
#include <string>

namespace pass_factory {

static std::string join(const std::string& dir, const std::string& name) {
    if (dir.empty())
        return name;
    if (dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

ScratchDir::ScratchDir(std::string path) : path_(std::move(path)) {
    make_directory(path_);
    clear_directory(path_);
}

ScratchDir::~ScratchDir() {
    remove_tree(path_);
}

std::string scratch_path(const Pass& pass, const FactoryConfig& cfg) {
    return join(cfg.temp_dir, pass.serial_number);
}

std::string output_path(const Pass& pass, const FactoryConfig& cfg,
                        const std::optional<std::string>& name)
{
    return join(cfg.output_dir, name.value_or(pass.serial_number) + kPassExtension);
}

static void sign(const std::string& dir, const FactoryConfig& cfg) {
    if (cfg.certificate.empty())
        throw CertificateError("No certificate configured for signing");
    if (cfg.wwdr.empty())
        throw CertificateError("No WWDR certificate configured for signing");

    pass_sign::sign_manifest(join(dir, manifest::kManifestFile),
                             join(dir, pass_sign::kSignatureFile),
                             cfg.certificate, cfg.password, cfg.wwdr);
}

std::string create(const Pass& pass, const FactoryConfig& cfg,
                   const std::optional<std::string>& name)
{
    if (name && !pass_validate::is_plain_name(*name))
        throw DefinitionError("Output name \"" + *name + "\" is not a plain file name");
    pass_validate::validate(pass);

    ScratchDir scratch(scratch_path(pass, cfg));
    pass_bundle::assemble(pass, scratch.path());
    manifest::write_manifest(scratch.path());

    if (!cfg.skip_signature)
        sign(scratch.path(), cfg);

    std::string out = output_path(pass, cfg, name);
    zip_archive::zip_directory(scratch.path(), out);
    return out;
}

} // namespace pass_factory

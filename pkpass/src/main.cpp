#include "config.hpp"
#include "errors.hpp"
#include "factory.hpp"
#include "pass_yaml.hpp"
#include "validator.hpp"
#include "verify.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <cstring>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " create   --pass <pass.yaml> [--config <cfg.yaml>] [--out <dir>]\n"
        "                   [--temp <dir>] [--name <base>] [--cert <file.p12>]\n"
        "                   [--password <pw>] [--wwdr <cert>] [--skip-signature]\n"
        "  " << prog << " validate --pass <pass.yaml>\n"
        "  " << prog << " verify   <file.pkpass>\n"
        "\n"
        "  --pass            Pass definition (YAML)\n"
        "  --config          Factory configuration (YAML); flags override it\n"
        "  --out <dir>       Output directory (default: .)\n"
        "  --temp <dir>      Scratch root (default: $TMPDIR or /tmp)\n"
        "  --name <base>     Archive base name (default: the serial number)\n"
        "  --cert            PKCS#12 file with the pass certificate and key\n"
        "  --password        PKCS#12 password\n"
        "  --wwdr            Trust-chain (WWDR) certificate, PEM or DER\n"
        "  --skip-signature  Do not sign (development builds)\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto, 3=I/O, 4=invalid pass\n";
}

static void print_validation(const ValidationError& e) {
    std::cerr << "Error: invalid pass:\n";
    for (const auto& msg : e.errors())
        std::cerr << "  - " << msg << "\n";
}

// ── create command ────────────────────────────────────────────────────────────

static int cmd_create(int argc, char* argv[]) {
    std::string pass_file, config_file;
    std::optional<std::string> out_dir, temp_dir, name, cert, password, wwdr;
    bool skip = false;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--skip-signature") {
            skip = true;
            continue;
        }
        if (flag != "--pass" && flag != "--config" && flag != "--out" && flag != "--temp" &&
            flag != "--name" && flag != "--cert" && flag != "--password" && flag != "--wwdr") {
            std::cerr << "Error: unknown option: " << flag << "\n";
            return 1;
        }
        if (++i >= argc) {
            std::cerr << "Error: " << flag << " requires a value\n";
            return 1;
        }
        std::string v = argv[i];

        if      (flag == "--pass")     pass_file   = v;
        else if (flag == "--config")   config_file = v;
        else if (flag == "--out")      out_dir     = v;
        else if (flag == "--temp")     temp_dir    = v;
        else if (flag == "--name")     name        = v;
        else if (flag == "--cert")     cert        = v;
        else if (flag == "--password") password    = v;
        else if (flag == "--wwdr")     wwdr        = v;
    }

    if (pass_file.empty()) {
        std::cerr << "Error: --pass is required\n";
        return 1;
    }

    FactoryConfig cfg;
    Pass pass;
    try {
        cfg  = config_file.empty() ? config::defaults() : config::load_config(config_file);
        pass = pass_yaml::load_pass(pass_file);
    } catch (const DefinitionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 4;
    }

    if (out_dir)  cfg.output_dir  = *out_dir;
    if (temp_dir) cfg.temp_dir    = *temp_dir;
    if (cert)     cfg.certificate = *cert;
    if (password) cfg.password    = *password;
    if (wwdr)     cfg.wwdr        = *wwdr;
    if (skip)     cfg.skip_signature = true;

    std::string archive;
    try {
        archive = pass_factory::create(pass, cfg, name);
    } catch (const ValidationError& e) {
        print_validation(e);
        return 4;
    } catch (const DefinitionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 4;
    } catch (const CertificateError& e) {
        std::cerr << "Error: certificate: " << e.what() << "\n";
        return 2;
    } catch (const SigningError& e) {
        std::cerr << "Error: signing: " << e.what() << "\n";
        return 2;
    } catch (const DirectoryError& e) {
        std::cerr << "Error: directory: " << e.what() << "\n";
        return 3;
    } catch (const ArchiveError& e) {
        std::cerr << "Error: archive: " << e.what() << "\n";
        return 3;
    } catch (const IoError& e) {
        std::cerr << "Error: bundle: " << e.what() << "\n";
        return 3;
    }

    std::cout << "Pass created:\n"
              << "  serial:  " << pass.serial_number << "\n"
              << "  type:    " << pass_type_key(pass.type) << "\n"
              << "  images:  " << pass.images.size() << "\n"
              << "  locales: " << pass.localizations.size() << "\n"
              << "  signed:  " << (cfg.skip_signature ? "no" : "yes") << "\n"
              << "  file:    " << archive << "\n";
    return 0;
}

// ── validate command ──────────────────────────────────────────────────────────

static int cmd_validate(int argc, char* argv[]) {
    std::string pass_file;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--pass") == 0) {
            if (++i >= argc) { std::cerr << "Error: --pass requires a value\n"; return 1; }
            pass_file = argv[i];
        } else {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        }
    }
    if (pass_file.empty()) {
        std::cerr << "Error: --pass is required\n";
        return 1;
    }

    try {
        pass_validate::validate(pass_yaml::load_pass(pass_file));
    } catch (const DefinitionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 4;
    } catch (const ValidationError& e) {
        print_validation(e);
        return 4;
    }

    std::cout << pass_file << ": valid\n";
    return 0;
}

// ── verify command ────────────────────────────────────────────────────────────

static int cmd_verify(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Error: verify takes exactly one .pkpass file\n";
        return 1;
    }

    pass_verify::Report report;
    try {
        report = pass_verify::verify_archive(argv[1]);
    } catch (const ArchiveError& e) {
        std::cerr << "Error: archive: " << e.what() << "\n";
        return 3;
    }

    if (!report.ok()) {
        std::cerr << "Error: " << argv[1] << " is damaged:\n";
        for (const auto& p : report.problems)
            std::cerr << "  - " << p << "\n";
        return 2;
    }

    std::cout << argv[1] << ": intact, " << report.files << " files, "
              << (report.is_signed ? "signed" : "unsigned") << "\n";
    return 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "create")   return cmd_create(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "verify")   return cmd_verify(argc - 1, argv + 1);

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Error: unknown command '" << cmd << "'\n";
    print_usage(argv[0]);
    return 1;
}

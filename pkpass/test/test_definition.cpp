#include "config.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "pass_yaml.hpp"
#include "test_util.hpp"
#include <cstdlib>

static const char kPassYaml[] = R"(type: eventTicket
serial-number: EVT-42
pass-type-identifier: pass.com.example.ticket
team-identifier: A1B2C3D4E5
organization-name: Example Hall
description: Concert ticket
background-color: rgb(10, 20, 30)
grouping-identifier: tour-2026
barcodes:
  - { format: PKBarcodeFormatQR, message: "EVT-42", alt-text: "EVT 42" }
locations:
  - { latitude: 52.52, longitude: 13.405, relevant-text: Main entrance }
fields:
  primary:
    - { key: event, label: EVENT, value: Concert }
  back:
    - { key: terms, value: No refunds }
images:
  - { path: img/icon.png }
  - { path: img/icon-hi.png, name: icon, scale: 2 }
localizations:
  - language: de
    strings: { GATE: Tor, SEAT: Platz }
    images:
      - { path: img/de/logo.png }
)";

template <typename F>
static bool throws_definition_error(F&& f) {
    try {
        f();
    } catch (const DefinitionError&) {
        return true;
    }
    return false;
}

int main() {
    std::string dir = make_temp_dir();
    write_bytes(dir + "/pass.yaml", kPassYaml);

    // Pass definition
    try {
        Pass p = pass_yaml::load_pass(dir + "/pass.yaml");
        check(p.type == PassType::EventTicket, "type");
        check(p.serial_number == "EVT-42", "serial");
        check(p.background_color && *p.background_color == "rgb(10, 20, 30)", "background color");
        check(!p.foreground_color, "unset color stays unset");
        check(p.barcodes.size() == 1 && p.barcodes[0].message_encoding == "iso-8859-1",
              "barcode with default encoding");
        check(p.locations.size() == 1 && p.locations[0].latitude == 52.52 &&
              !p.locations[0].altitude, "location");
        check(p.fields.primary.size() == 1 && p.fields.back.size() == 1, "field groups");
        check(p.images.size() == 2, "two images");
        if (p.images.size() == 2) {
            check(p.images[0].source == dir + "/img/icon.png", "image path relative to file");
            check(p.images[1].name && *p.images[1].name == "icon" && p.images[1].scale == 2,
                  "name override and scale");
        }
        check(p.localizations.size() == 1 && p.localizations[0].strings.size() == 2 &&
              p.localizations[0].strings.at("GATE") == "Tor", "localization strings");
    } catch (const std::exception& e) {
        check(false, std::string("load_pass threw: ") + e.what());
    }

    check(throws_definition_error([] { pass_yaml::parse_pass("type: ferry\n", ""); }),
          "unknown type rejected");
    check(throws_definition_error([] {
        pass_yaml::parse_pass("type: generic\nserial-number: X\n", "");
    }), "missing identifiers rejected");

    const std::string head =
        "type: generic\nserial-number: X\npass-type-identifier: p\nteam-identifier: t\n"
        "organization-name: o\ndescription: d\n";
    check(!throws_definition_error([&] { pass_yaml::parse_pass(head, ""); }), "minimal definition");
    check(throws_definition_error([&] {
        pass_yaml::parse_pass(head + "images:\n  - { path: a.png, scale: 4 }\n", "");
    }), "scale 4 rejected");
    check(throws_definition_error([&] {
        pass_yaml::parse_pass(head + "locations:\n  - { latitude: 1.0 }\n", "");
    }), "location without longitude rejected");
    check(throws_definition_error([&] {
        pass_yaml::parse_pass(head + "transit-type: PKTransitTypeRocket\n", "");
    }), "unknown transit type rejected");
    check(throws_definition_error([] {
        pass_yaml::parse_pass("type: generic\nserial-number: ../x\npass-type-identifier: p\n"
                              "team-identifier: t\norganization-name: o\ndescription: d\n", "");
    }), "serial with path separator rejected");
    check(throws_definition_error([] { pass_yaml::load_pass("/nonexistent/pass.yaml"); }),
          "missing definition file rejected");

    // Configuration
    write_bytes(dir + "/pkpass.yaml",
                "temp-dir: scratch\n"
                "output-dir: /srv/passes\n"
                "certificate: certs/pass.p12\n"
                "wwdr: certs/wwdr.pem\n"
                "password-env: PKPASS_TEST_PASSWORD\n"
                "skip-signature: true\n");
    setenv("PKPASS_TEST_PASSWORD", "from-env", 1);
    try {
        FactoryConfig cfg = config::load_config(dir + "/pkpass.yaml");
        check(cfg.temp_dir == dir + "/scratch", "relative temp-dir resolved against file");
        check(cfg.output_dir == "/srv/passes", "absolute output-dir kept");
        check(cfg.certificate == dir + "/certs/pass.p12", "certificate path");
        check(cfg.wwdr == dir + "/certs/wwdr.pem", "wwdr path");
        check(cfg.password == "from-env", "password from environment");
        check(cfg.skip_signature, "skip-signature");
    } catch (const std::exception& e) {
        check(false, std::string("load_config threw: ") + e.what());
    }

    write_bytes(dir + "/minimal.yaml", "password: secret\n");
    try {
        FactoryConfig cfg = config::load_config(dir + "/minimal.yaml");
        check(cfg.output_dir == ".", "default output dir");
        check(!cfg.temp_dir.empty(), "default temp dir");
        check(cfg.password == "secret" && !cfg.skip_signature, "inline password, signing on");
    } catch (const std::exception& e) {
        check(false, std::string("load_config (minimal) threw: ") + e.what());
    }

    unsetenv("PKPASS_TEST_PASSWORD");
    check(throws_definition_error([&] { config::load_config(dir + "/pkpass.yaml"); }),
          "unset password variable rejected");

    write_bytes(dir + "/bad.yaml", "skip-signature: maybe\n");
    check(throws_definition_error([&] { config::load_config(dir + "/bad.yaml"); }),
          "non-boolean skip-signature rejected");

    remove_tree(dir);
    return finish();
}

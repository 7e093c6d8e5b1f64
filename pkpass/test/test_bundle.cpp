#include "bundle.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "pass_json.hpp"
#include "test_util.hpp"
#include <nlohmann/json.hpp>

int main() {
    // Escaping follows the strings-file rules: quote, apostrophe, backslash, NUL
    check(pass_bundle::escape_string("Tor") == "Tor", "plain string unchanged");
    check(pass_bundle::escape_string("say \"hi\"") == "say \\\"hi\\\"", "double quotes escaped");
    check(pass_bundle::escape_string("C:\\dir") == "C:\\\\dir", "backslash escaped");
    check(pass_bundle::escape_string("it's") == "it\\'s", "apostrophe escaped");
    check(pass_bundle::escape_string(std::string("a\0b", 3)) == "a\\0b", "NUL escaped");

    {
        Localization loc;
        loc.language = "de";
        loc.strings["GATE"] = "Tor";
        loc.strings["SEAT"] = "Platz \"A\"";
        check(pass_bundle::strings_file(loc) ==
              "\"GATE\" = \"Tor\";\n\"SEAT\" = \"Platz \\\"A\\\"\";\n",
              "strings file lines");
        loc.strings.clear();
        check(pass_bundle::strings_file(loc).empty(), "no strings, empty file");
    }

    std::string src = make_temp_dir();
    std::string dir = make_temp_dir();
    write_bytes(src + "/icon.png", fake_png("icon-1x"));
    write_bytes(src + "/icon-retina.png", fake_png("icon-2x"));
    write_bytes(src + "/logo-de.png", fake_png("logo-de"));
    write_bytes(src + "/bg.png", fake_png("bg-fr"));

    Pass pass = make_pass(PassType::EventTicket, "EVT-1");
    pass.logo_text = "Example Hall";
    pass.fields.primary.push_back({"event", "Concert", std::string("EVENT"), std::nullopt});
    pass.images.push_back(make_image(src + "/icon.png"));
    pass.images.push_back(make_image(src + "/icon-retina.png", "icon", 2));

    Localization de;
    de.language = "de";
    de.strings["GATE"] = "Tor";
    de.images.push_back(make_image(src + "/logo-de.png"));
    pass.localizations.push_back(de);

    Localization fr;
    fr.language = "fr";
    fr.strings["GATE"] = "Porte";
    fr.images.push_back(make_image(src + "/bg.png", "background.png", 2));
    pass.localizations.push_back(fr);

    try {
        pass_bundle::assemble(pass, dir);
    } catch (const std::exception& e) {
        check(false, std::string("assemble threw: ") + e.what());
        return finish();
    }

    check(path_exists(dir + "/pass.json"), "pass.json written");
    check(read_file_text(dir + "/icon.png") == fake_png("icon-1x"), "icon.png copied verbatim");
    check(read_file_text(dir + "/icon@2x.png") == fake_png("icon-2x"), "override + scale names icon@2x.png");
    check(!path_exists(dir + "/icon-retina.png"), "source name not used when overridden");
    check(read_file_text(dir + "/de.lproj/pass.strings") == "\"GATE\" = \"Tor\";\n", "de strings");
    check(read_file_text(dir + "/de.lproj/logo-de.png") == fake_png("logo-de"), "localized image, original name");
    check(path_exists(dir + "/fr.lproj/background.png"), "localized image, literal override, no scale suffix");
    check(!path_exists(dir + "/fr.lproj/background.png@2x"), "no scale suffix on localized images");

    // pass.json is the serialized content document
    {
        auto j = nlohmann::json::parse(read_file_text(dir + "/pass.json"));
        check(j["formatVersion"] == 1, "formatVersion");
        check(j["serialNumber"] == "EVT-1", "serialNumber");
        check(j["logoText"] == "Example Hall", "logoText");
        check(j["eventTicket"]["primaryFields"][0]["key"] == "event", "primary field key");
        check(j["eventTicket"]["primaryFields"][0]["label"] == "EVENT", "primary field label");
        check(!j.contains("backgroundColor"), "unset optional omitted");
        check(!j.contains("voided"), "voided omitted when false");
        check(read_file_text(dir + "/pass.json").find("\n    \"formatVersion\"") != std::string::npos,
              "pretty-printed with four spaces");
    }

    // Boarding pass carries its transit type in the style dictionary
    {
        Pass bp = make_pass(PassType::BoardingPass, "BP-1");
        bp.transit_type = TransitType::Air;
        auto j = nlohmann::json::parse(pass_json::to_json(bp));
        check(j["boardingPass"]["transitType"] == "PKTransitTypeAir", "transitType");
        bp.type = PassType::Generic;
        j = nlohmann::json::parse(pass_json::to_json(bp));
        check(!j["generic"].contains("transitType"), "transitType only on boarding passes");
    }

    // Missing source image is an I/O failure
    {
        Pass bad = make_pass(PassType::Generic, "BAD-1");
        bad.images.push_back(make_image(src + "/missing.png"));
        bool threw = false;
        try {
            pass_bundle::copy_images(bad, dir);
        } catch (const IoError&) {
            threw = true;
        }
        check(threw, "missing image -> IoError");
    }

    // A plain file where the localization directory should go
    {
        std::string blocked = make_temp_dir();
        write_bytes(blocked + "/de.lproj", "not a directory");
        Pass p = make_pass(PassType::Generic, "BLK-1");
        p.localizations.push_back(de);
        bool threw = false;
        try {
            pass_bundle::write_localizations(p, blocked);
        } catch (const DirectoryError&) {
            threw = true;
        }
        check(threw, "blocked .lproj -> DirectoryError");
        remove_tree(blocked);
    }

    remove_tree(src);
    remove_tree(dir);
    return finish();
}

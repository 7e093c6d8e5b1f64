#include "pass_yaml.hpp"
#include "errors.hpp"
#include "validator.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <string>

namespace pass_yaml {

// ── Scalars ───────────────────────────────────────────────────────────────────

static std::string require_str(const YAML::Node& node, const char* key) {
    if (!node[key])
        throw DefinitionError(std::string("pass definition: missing '") + key + "'");
    return node[key].as<std::string>();
}

static std::optional<std::string> optional_str(const YAML::Node& node, const char* key) {
    if (!node[key]) return std::nullopt;
    return node[key].as<std::string>();
}

static std::optional<double> optional_double(const YAML::Node& node, const char* key) {
    if (!node[key]) return std::nullopt;
    return node[key].as<double>();
}

static std::string resolve(const std::string& base, const std::string& p) {
    if (p.empty() || p[0] == '/' || base.empty())
        return p;
    if (base.back() == '/')
        return base + p;
    return base + "/" + p;
}

// ── Components ────────────────────────────────────────────────────────────────

static Image parse_image(const YAML::Node& node, const std::string& base) {
    Image img;
    img.source = resolve(base, require_str(node, "path"));
    img.name   = optional_str(node, "name");
    img.scale  = node["scale"].as<int>(1);
    if (img.scale < 1 || img.scale > 3)
        throw DefinitionError("pass definition: image " + img.source +
                              ": scale must be 1, 2 or 3 (got " + std::to_string(img.scale) + ")");
    return img;
}

static std::vector<Image> parse_images(const YAML::Node& seq, const std::string& base) {
    std::vector<Image> images;
    if (!seq) return images;
    if (!seq.IsSequence())
        throw DefinitionError("pass definition: 'images' must be a sequence");
    for (const auto& node : seq)
        images.push_back(parse_image(node, base));
    return images;
}

static Localization parse_localization(const YAML::Node& node, const std::string& base) {
    Localization loc;
    loc.language = require_str(node, "language");
    if (!pass_validate::is_plain_name(loc.language))
        throw DefinitionError("pass definition: bad language code '" + loc.language + "'");

    YAML::Node strings = node["strings"];
    if (strings) {
        if (!strings.IsMap())
            throw DefinitionError("pass definition: strings for '" + loc.language +
                                  "' must be a mapping");
        for (const auto& kv : strings)
            loc.strings[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
    loc.images = parse_images(node["images"], base);
    return loc;
}

static std::vector<Field> parse_fields(const YAML::Node& seq) {
    std::vector<Field> fields;
    if (!seq) return fields;
    for (const auto& node : seq) {
        Field f;
        f.key            = require_str(node, "key");
        f.value          = require_str(node, "value");
        f.label          = optional_str(node, "label");
        f.change_message = optional_str(node, "change-message");
        fields.push_back(std::move(f));
    }
    return fields;
}

static Barcode parse_barcode(const YAML::Node& node) {
    Barcode b;
    b.format  = require_str(node, "format");
    b.message = require_str(node, "message");
    if (node["message-encoding"])
        b.message_encoding = node["message-encoding"].as<std::string>();
    b.alt_text = optional_str(node, "alt-text");
    return b;
}

static Location parse_location(const YAML::Node& node) {
    if (!node["latitude"] || !node["longitude"])
        throw DefinitionError("pass definition: location needs latitude and longitude");
    Location l;
    l.latitude      = node["latitude"].as<double>();
    l.longitude     = node["longitude"].as<double>();
    l.altitude      = optional_double(node, "altitude");
    l.relevant_text = optional_str(node, "relevant-text");
    return l;
}

// ── Document ──────────────────────────────────────────────────────────────────

static Pass build_pass(const YAML::Node& doc, const std::string& base) {
    if (!doc.IsMap())
        throw DefinitionError("pass definition: top level must be a mapping");

    Pass pass;
    try {
        pass.type = pass_type_from_key(require_str(doc, "type"));
    } catch (const std::invalid_argument& e) {
        throw DefinitionError(std::string("pass definition: ") + e.what());
    }

    pass.format_version       = doc["format-version"].as<int>(1);
    pass.serial_number        = require_str(doc, "serial-number");
    pass.pass_type_identifier = require_str(doc, "pass-type-identifier");
    pass.team_identifier      = require_str(doc, "team-identifier");
    pass.organization_name    = require_str(doc, "organization-name");
    pass.description          = require_str(doc, "description");

    pass.logo_text            = optional_str(doc, "logo-text");
    pass.foreground_color     = optional_str(doc, "foreground-color");
    pass.background_color     = optional_str(doc, "background-color");
    pass.label_color          = optional_str(doc, "label-color");
    pass.grouping_identifier  = optional_str(doc, "grouping-identifier");
    pass.web_service_url      = optional_str(doc, "web-service-url");
    pass.authentication_token = optional_str(doc, "authentication-token");
    pass.relevant_date        = optional_str(doc, "relevant-date");
    pass.expiration_date      = optional_str(doc, "expiration-date");
    pass.voided               = doc["voided"].as<bool>(false);

    if (auto transit = optional_str(doc, "transit-type")) {
        try {
            pass.transit_type = transit_type_from_key(*transit);
        } catch (const std::invalid_argument& e) {
            throw DefinitionError(std::string("pass definition: ") + e.what());
        }
    }

    if (!pass_validate::is_plain_name(pass.serial_number))
        throw DefinitionError("pass definition: serial-number must be a plain file name");

    for (const auto& node : doc["barcodes"])
        pass.barcodes.push_back(parse_barcode(node));
    for (const auto& node : doc["locations"])
        pass.locations.push_back(parse_location(node));

    YAML::Node fields = doc["fields"];
    if (fields) {
        pass.fields.header    = parse_fields(fields["header"]);
        pass.fields.primary   = parse_fields(fields["primary"]);
        pass.fields.secondary = parse_fields(fields["secondary"]);
        pass.fields.auxiliary = parse_fields(fields["auxiliary"]);
        pass.fields.back      = parse_fields(fields["back"]);
    }

    pass.images = parse_images(doc["images"], base);
    for (const auto& node : doc["localizations"])
        pass.localizations.push_back(parse_localization(node, base));

    return pass;
}

static Pass build_checked(const YAML::Node& doc, const std::string& base) {
    try {
        return build_pass(doc, base);
    } catch (const YAML::Exception& e) {
        throw DefinitionError(std::string("pass definition: ") + e.what());
    }
}

Pass parse_pass(const std::string& yaml, const std::string& base_dir) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw DefinitionError(std::string("pass definition: ") + e.what());
    }
    return build_checked(doc, base_dir);
}

Pass load_pass(const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw DefinitionError("Cannot load pass definition " + path + ": " + e.what());
    }
    auto slash = path.find_last_of('/');
    std::string base = slash == std::string::npos ? "" : path.substr(0, slash);
    return build_checked(doc, base);
}

} // namespace pass_yaml

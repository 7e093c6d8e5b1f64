#include "pass_json.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <string>

using ordered_json = nlohmann::ordered_json;

namespace pass_json {

// ── Components ────────────────────────────────────────────────────────────────

template <typename T>
static void put_optional(ordered_json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

static ordered_json field_json(const Field& f) {
    ordered_json j;
    j["key"] = f.key;
    put_optional(j, "label", f.label);
    j["value"] = f.value;
    put_optional(j, "changeMessage", f.change_message);
    return j;
}

static void put_fields(ordered_json& j, const char* key, const std::vector<Field>& fields) {
    if (fields.empty()) return;
    ordered_json arr = ordered_json::array();
    for (const auto& f : fields)
        arr.push_back(field_json(f));
    j[key] = std::move(arr);
}

static ordered_json barcode_json(const Barcode& b) {
    ordered_json j;
    j["format"]          = b.format;
    j["message"]         = b.message;
    j["messageEncoding"] = b.message_encoding;
    put_optional(j, "altText", b.alt_text);
    return j;
}

static ordered_json location_json(const Location& l) {
    ordered_json j;
    put_optional(j, "altitude", l.altitude);
    j["latitude"]  = l.latitude;
    j["longitude"] = l.longitude;
    put_optional(j, "relevantText", l.relevant_text);
    return j;
}

// Style dictionary under "boardingPass", "coupon", ...
static ordered_json structure_json(const Pass& pass) {
    ordered_json j = ordered_json::object();
    if (pass.type == PassType::BoardingPass && pass.transit_type)
        j["transitType"] = transit_type_key(*pass.transit_type);
    put_fields(j, "headerFields",    pass.fields.header);
    put_fields(j, "primaryFields",   pass.fields.primary);
    put_fields(j, "secondaryFields", pass.fields.secondary);
    put_fields(j, "auxiliaryFields", pass.fields.auxiliary);
    put_fields(j, "backFields",      pass.fields.back);
    return j;
}

// ── Document ──────────────────────────────────────────────────────────────────

std::string to_json(const Pass& pass) {
    ordered_json j;
    j["formatVersion"]      = pass.format_version;
    j["passTypeIdentifier"] = pass.pass_type_identifier;
    j["serialNumber"]       = pass.serial_number;
    j["teamIdentifier"]     = pass.team_identifier;
    j["organizationName"]   = pass.organization_name;
    j["description"]        = pass.description;

    put_optional(j, "logoText",        pass.logo_text);
    put_optional(j, "foregroundColor", pass.foreground_color);
    put_optional(j, "backgroundColor", pass.background_color);
    put_optional(j, "labelColor",      pass.label_color);

    if (pass.type == PassType::EventTicket || pass.type == PassType::BoardingPass)
        put_optional(j, "groupingIdentifier", pass.grouping_identifier);

    put_optional(j, "webServiceURL",       pass.web_service_url);
    put_optional(j, "authenticationToken", pass.authentication_token);
    put_optional(j, "relevantDate",        pass.relevant_date);
    put_optional(j, "expirationDate",      pass.expiration_date);
    if (pass.voided)
        j["voided"] = true;

    if (!pass.barcodes.empty()) {
        ordered_json arr = ordered_json::array();
        for (const auto& b : pass.barcodes)
            arr.push_back(barcode_json(b));
        j["barcodes"] = std::move(arr);
    }

    if (!pass.locations.empty()) {
        ordered_json arr = ordered_json::array();
        for (const auto& l : pass.locations)
            arr.push_back(location_json(l));
        j["locations"] = std::move(arr);
    }

    j[pass_type_key(pass.type)] = structure_json(pass);

    try {
        return j.dump(4);
    } catch (const nlohmann::json::type_error& e) {
        throw DefinitionError(std::string("pass.json: ") + e.what());
    }
}

} // namespace pass_json

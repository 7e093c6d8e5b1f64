#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>

enum class PassType { BoardingPass, Coupon, EventTicket, Generic, StoreCard };

enum class TransitType { Air, Boat, Bus, Generic, Train };

// One visual asset. The on-disk name is derived from `name` (+ "@Nx" for
// scale > 1) or, without an override, from the source file's own stem.
struct Image {
    std::string                source;  // path to the PNG on disk
    std::optional<std::string> name;    // e.g. "icon", "logo"
    int                        scale = 1;

    // "png" for "/a/b/icon@2x.png"; empty if the file has no extension.
    std::string extension() const;
    // "icon@2x.png"
    std::string filename() const;
    // "icon@2x"
    std::string stem() const;
};

struct Localization {
    std::string                        language;  // e.g. "de", "zh-Hans"
    std::map<std::string, std::string> strings;
    std::vector<Image>                 images;    // copied under their literal names
};

struct Field {
    std::string                key;
    std::string                value;
    std::optional<std::string> label;
    std::optional<std::string> change_message;
};

struct FieldSet {
    std::vector<Field> header;
    std::vector<Field> primary;
    std::vector<Field> secondary;
    std::vector<Field> auxiliary;
    std::vector<Field> back;
};

struct Barcode {
    std::string                format;            // "PKBarcodeFormatQR", ...
    std::string                message;
    std::string                message_encoding = "iso-8859-1";
    std::optional<std::string> alt_text;
};

struct Location {
    double                     latitude  = 0.0;
    double                     longitude = 0.0;
    std::optional<double>      altitude;
    std::optional<std::string> relevant_text;
};

struct Pass {
    PassType    type = PassType::Generic;
    int         format_version = 1;
    std::string serial_number;
    std::string pass_type_identifier;
    std::string team_identifier;
    std::string organization_name;
    std::string description;

    std::optional<std::string> logo_text;
    std::optional<std::string> foreground_color;   // "rgb(r, g, b)"
    std::optional<std::string> background_color;
    std::optional<std::string> label_color;
    std::optional<std::string> grouping_identifier;
    std::optional<std::string> web_service_url;
    std::optional<std::string> authentication_token;
    std::optional<std::string> relevant_date;      // W3C date, passed through
    std::optional<std::string> expiration_date;
    bool                       voided = false;
    std::optional<TransitType> transit_type;       // boarding passes only

    std::vector<Barcode>  barcodes;
    std::vector<Location> locations;
    FieldSet              fields;

    std::vector<Image>        images;
    std::vector<Localization> localizations;
};

// "boardingPass", "coupon", "eventTicket", "generic", "storeCard"
const char* pass_type_key(PassType t);

// Inverse of pass_type_key. Throws std::invalid_argument on unknown keys.
PassType pass_type_from_key(const std::string& key);

// "PKTransitTypeAir", ...
const char* transit_type_key(TransitType t);
TransitType transit_type_from_key(const std::string& key);

#include "validator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace pass_validate {

const std::vector<std::string>& allowed_images(PassType t) {
    static const std::vector<std::string> boarding = {"logo", "icon", "footer"};
    static const std::vector<std::string> coupon   = {"logo", "icon", "strip"};
    static const std::vector<std::string> event    = {"logo", "icon", "strip", "background", "thumbnail"};
    static const std::vector<std::string> generic  = {"logo", "icon", "thumbnail"};
    static const std::vector<std::string> store    = {"logo", "icon", "strip"};

    switch (t) {
        case PassType::BoardingPass: return boarding;
        case PassType::Coupon:       return coupon;
        case PassType::EventTicket:  return event;
        case PassType::Generic:      return generic;
        case PassType::StoreCard:    return store;
    }
    throw std::invalid_argument("Unknown pass type");
}

std::string image_name(const Image& img) {
    if (img.name) {
        if (img.scale > 1)
            return *img.name + "@" + std::to_string(img.scale) + "x";
        return *img.name;
    }
    return img.stem();
}

std::string normalize_name(const std::string& name) {
    std::string out = name;
    for (const char* suffix : {"@2x", "@3x"}) {
        size_t pos;
        while ((pos = out.find(suffix)) != std::string::npos)
            out.erase(pos, 3);
    }
    return out;
}

bool is_plain_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool is_allowed(const std::string& name, PassType t) {
    const auto& allowed = allowed_images(t);
    return std::find(allowed.begin(), allowed.end(), name) != allowed.end()
        || std::find(allowed.begin(), allowed.end(), normalize_name(name)) != allowed.end();
}

// A strip image excludes background and thumbnail on event tickets.
static bool strip_conflicts(const Pass& pass) {
    bool has_strip = false;
    bool has_thumb_or_bg = false;
    for (const auto& img : pass.images) {
        std::string role = normalize_name(image_name(img));
        if (role == "strip")
            has_strip = true;
        else if (role == "thumbnail" || role == "background")
            has_thumb_or_bg = true;
    }
    return has_strip && has_thumb_or_bg;
}

std::vector<std::string> check(const Pass& pass) {
    std::vector<std::string> errors;
    bool has_icon = false;

    if (!is_plain_name(pass.serial_number))
        errors.push_back("Invalid serial number `" + pass.serial_number +
                         "`: it must be usable as a directory name.");

    for (const auto& img : pass.images) {
        std::string name = image_name(img);
        if (normalize_name(name) == "icon")
            has_icon = true;

        std::string ext = img.extension();
        if (to_lower(ext) != "png")
            errors.push_back(img.filename() + ": expected .png extension, found ." + ext);

        if (img.scale < 1 || img.scale > 3)
            errors.push_back(img.filename() + ": scale must be 1, 2 or 3, found " +
                             std::to_string(img.scale));

        if (!is_allowed(name, pass.type))
            errors.push_back("Invalid image type `" + name + "` for pass type `" +
                             pass_type_key(pass.type) + "`.");
    }

    if (pass.type == PassType::EventTicket && strip_conflicts(pass))
        errors.push_back("When specifying a strip image, no background image or "
                         "thumbnail may be specified.");

    if (!has_icon)
        errors.push_back("The pass must have an icon image.");

    for (const auto& loc : pass.localizations)
        if (!is_plain_name(loc.language))
            errors.push_back("Invalid language code `" + loc.language +
                             "`: it must be usable as a directory name.");

    return errors;
}

void validate(const Pass& pass) {
    auto errors = check(pass);
    if (!errors.empty())
        throw ValidationError(std::move(errors));
}

} // namespace pass_validate

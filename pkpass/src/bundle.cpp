#include "bundle.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "pass_json.hpp"
#include "validator.hpp"
#include <stdexcept>
#include <string>

namespace pass_bundle {

static std::string join(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

std::string escape_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\'': out += "\\'";  break;
            case '\\': out += "\\\\"; break;
            case '\0': out += "\\0";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

std::string strings_file(const Localization& loc) {
    std::string out;
    for (const auto& [key, value] : loc.strings)
        out += "\"" + escape_string(key) + "\" = \"" + escape_string(value) + "\";\n";
    return out;
}

void write_pass_json(const Pass& pass, const std::string& dir) {
    std::string path = join(dir, kPassFile);
    try {
        write_file(path, pass_json::to_json(pass));
    } catch (const std::runtime_error& e) {
        throw IoError(e.what());
    }
}

// Copy one image, turning the low-level failure into IoError.
static void copy_image(const Image& img, const std::string& dst) {
    try {
        copy_file(img.source, dst);
    } catch (const std::runtime_error& e) {
        throw IoError(std::string("Cannot copy image: ") + e.what());
    }
}

void copy_images(const Pass& pass, const std::string& dir) {
    for (const auto& img : pass.images) {
        std::string name = pass_validate::image_name(img) + "." + img.extension();
        copy_image(img, join(dir, name));
    }
}

void write_localizations(const Pass& pass, const std::string& dir) {
    for (const auto& loc : pass.localizations) {
        std::string loc_dir = join(dir, loc.language + kLocalizationSuffix);
        make_directory(loc_dir);

        try {
            write_file(join(loc_dir, kStringsFile), strings_file(loc));
        } catch (const std::runtime_error& e) {
            throw IoError(e.what());
        }

        for (const auto& img : loc.images)
            copy_image(img, join(loc_dir, img.name ? *img.name : img.filename()));
    }
}

void assemble(const Pass& pass, const std::string& dir) {
    write_pass_json(pass, dir);
    copy_images(pass, dir);
    write_localizations(pass, dir);
}

} // namespace pass_bundle

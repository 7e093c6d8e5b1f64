#pragma once
#include "pass.hpp"
#include <string>

// Materializes the bundle file tree of a validated pass inside a scratch
// directory:
//
//   pass.json
//   <image-name>.<ext>             one per top-level image
//   <language>.lproj/pass.strings  one directory per localization
//   <language>.lproj/<image>       localized images, literal names
//
// manifest.json and signature are added later by the manifest and
// signing stages.

namespace pass_bundle {

static constexpr char kPassFile[]          = "pass.json";
static constexpr char kStringsFile[]       = "pass.strings";
static constexpr char kLocalizationSuffix[] = ".lproj";

// Escapes '"', '\'', '\\' and NUL with a backslash.
std::string escape_string(const std::string& s);

// One `"key" = "value";` line per entry, '\n'-terminated.
std::string strings_file(const Localization& loc);

// Writes pass.json. Throws IoError.
void write_pass_json(const Pass& pass, const std::string& dir);

// Copies every top-level image to <dir>/<image_name>.<ext>. Throws IoError.
void copy_images(const Pass& pass, const std::string& dir);

// Creates <dir>/<language>.lproj/ with pass.strings and localized images.
// Throws DirectoryError or IoError.
void write_localizations(const Pass& pass, const std::string& dir);

// All of the above, in that order.
void assemble(const Pass& pass, const std::string& dir);

} // namespace pass_bundle

#pragma once
#include "pass.hpp"
#include <string>
#include <vector>

namespace pass_validate {

// Image roles a pass variant may carry, e.g. {"logo", "icon", "footer"}
// for boarding passes.
const std::vector<std::string>& allowed_images(PassType t);

// Name an image gets inside the bundle, without extension: the override
// (+ "@2x"/"@3x" when scale > 1) or the source file's stem.
std::string image_name(const Image& img);

// Drops every "@2x"/"@3x" so that "icon@2x" and "icon" compare equal.
std::string normalize_name(const std::string& name);

// True for a name usable as one path component: non-empty, no '/', not
// "." or "..".
bool is_plain_name(const std::string& name);

// Runs every image rule, plus the serial number and language code checks,
// and returns all violations in order; an empty vector means the pass is
// valid.
std::vector<std::string> check(const Pass& pass);

// check() and throw ValidationError carrying the list if it is non-empty.
void validate(const Pass& pass);

} // namespace pass_validate

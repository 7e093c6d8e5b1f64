#pragma once
#include "pass.hpp"
#include <string>

namespace pass_json {

// pass.json content: every populated field of the pass, pretty-printed
// with four-space indentation. Image and localization data are not part
// of the document.
std::string to_json(const Pass& pass);

} // namespace pass_json

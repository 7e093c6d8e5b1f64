#pragma once
#include "pass.hpp"
#include <string>

namespace pass_yaml {

// Load a Pass from a YAML definition file:
//
//   type: eventTicket            # boardingPass | coupon | eventTicket | generic | storeCard
//   serial-number: ABC123
//   pass-type-identifier: pass.com.example.ticket
//   team-identifier: A1B2C3D4E5
//   organization-name: Example
//   description: Concert ticket
//   images:
//     - { path: img/icon.png }
//     - { path: img/logo-hi.png, name: logo, scale: 2 }
//   localizations:
//     - language: de
//       strings: { GATE: Tor }
//       images: [ { path: img/de/logo.png } ]
//
// plus the optional content keys (colors, barcodes, locations, fields, ...).
// Image paths are relative to the file. Throws DefinitionError.
Pass load_pass(const std::string& path);

// Same, from YAML text; relative image paths are resolved against base_dir.
Pass parse_pass(const std::string& yaml, const std::string& base_dir);

} // namespace pass_yaml

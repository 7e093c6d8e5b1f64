#include "pass.hpp"
#include <stdexcept>
#include <string>

// ── Image ─────────────────────────────────────────────────────────────────────

std::string Image::filename() const {
    auto slash = source.find_last_of('/');
    return slash == std::string::npos ? source : source.substr(slash + 1);
}

std::string Image::extension() const {
    std::string f = filename();
    auto dot = f.rfind('.');
    if (dot == std::string::npos)
        return "";
    return f.substr(dot + 1);
}

std::string Image::stem() const {
    std::string f   = filename();
    std::string ext = extension();
    if (ext.empty())
        return f;
    return f.substr(0, f.size() - ext.size() - 1);
}

// ── PassType ──────────────────────────────────────────────────────────────────

const char* pass_type_key(PassType t) {
    switch (t) {
        case PassType::BoardingPass: return "boardingPass";
        case PassType::Coupon:       return "coupon";
        case PassType::EventTicket:  return "eventTicket";
        case PassType::Generic:      return "generic";
        case PassType::StoreCard:    return "storeCard";
    }
    throw std::invalid_argument("Unknown pass type");
}

PassType pass_type_from_key(const std::string& key) {
    if (key == "boardingPass") return PassType::BoardingPass;
    if (key == "coupon")       return PassType::Coupon;
    if (key == "eventTicket")  return PassType::EventTicket;
    if (key == "generic")      return PassType::Generic;
    if (key == "storeCard")    return PassType::StoreCard;
    throw std::invalid_argument("Unknown pass type: " + key);
}

// ── TransitType ───────────────────────────────────────────────────────────────

const char* transit_type_key(TransitType t) {
    switch (t) {
        case TransitType::Air:     return "PKTransitTypeAir";
        case TransitType::Boat:    return "PKTransitTypeBoat";
        case TransitType::Bus:     return "PKTransitTypeBus";
        case TransitType::Generic: return "PKTransitTypeGeneric";
        case TransitType::Train:   return "PKTransitTypeTrain";
    }
    throw std::invalid_argument("Unknown transit type");
}

TransitType transit_type_from_key(const std::string& key) {
    if (key == "PKTransitTypeAir")     return TransitType::Air;
    if (key == "PKTransitTypeBoat")    return TransitType::Boat;
    if (key == "PKTransitTypeBus")     return TransitType::Bus;
    if (key == "PKTransitTypeGeneric") return TransitType::Generic;
    if (key == "PKTransitTypeTrain")   return TransitType::Train;
    throw std::invalid_argument("Unknown transit type: " + key);
}

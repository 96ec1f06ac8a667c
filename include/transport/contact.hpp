#pragma once
#include <string>

namespace bmc_2d {

// Device edges sit on layer 0; every other layer is a contact
constexpr int kDeviceBoundaryLayer = 0;

enum class ContactKind {
    DEVICE_BOUNDARY,  // Scatters or reflects, never absorbs
    GROUNDED,         // Absorbs and ends the trajectory
    FLOATING          // Absorbs and re-injects on the same layer
};

struct ContactClass {
    ContactKind kind = ContactKind::DEVICE_BOUNDARY;
    int layer = kDeviceBoundaryLayer;
};

inline ContactClass classify_layer(int layer, int grounded_layer) {
    if (layer == kDeviceBoundaryLayer) {
        return {ContactKind::DEVICE_BOUNDARY, layer};
    }
    if (layer == grounded_layer) {
        return {ContactKind::GROUNDED, layer};
    }
    return {ContactKind::FLOATING, layer};
}

inline std::string contact_kind_to_string(ContactKind kind) {
    switch (kind) {
        case ContactKind::DEVICE_BOUNDARY: return "device_boundary";
        case ContactKind::GROUNDED:        return "grounded";
        case ContactKind::FLOATING:        return "floating";
    }
    return "unknown";
}

} // namespace bmc_2d

#include "cut.h"

#include <cstdio>

namespace sc {
namespace optimizer {

const char* wasteCategoryLabel(WasteCategory category) {
    switch (category) {
    case WasteCategory::Minimal:
        return "minimal";
    case WasteCategory::Small:
        return "small";
    case WasteCategory::Medium:
        return "medium";
    case WasteCategory::Large:
        return "large";
    case WasteCategory::Excessive:
        return "excessive";
    }
    return "minimal";
}

WasteCategory categorizeWaste(Millimeters remainder, const WastePolicy& policy) {
    if (remainder < policy.minimalBelow) {
        return WasteCategory::Minimal;
    }
    if (remainder < policy.smallBelow) {
        return WasteCategory::Small;
    }
    if (remainder < policy.mediumBelow) {
        return WasteCategory::Medium;
    }
    if (remainder <= policy.largeUpTo) {
        return WasteCategory::Large;
    }
    return WasteCategory::Excessive;
}

bool isReclaimableWaste(Millimeters remainder, const WastePolicy& policy) {
    if (remainder < policy.reclaimFloor) {
        return false;
    }
    WasteCategory category = categorizeWaste(remainder, policy);
    return category == WasteCategory::Large || category == WasteCategory::Excessive;
}

std::string Cut::patternKey() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", stockLength);
    std::string key = buf;
    key += ':';
    for (usize i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            key += '+';
        }
        std::snprintf(buf, sizeof(buf), "%.1f", segments[i].length);
        key += buf;
    }
    return key;
}

} // namespace optimizer
} // namespace sc

#pragma once

#include <string>
#include <vector>

#include "../types.h"
#include "algorithm_config.h"

namespace sc {
namespace optimizer {

// Unused remainder class of one bar
enum class WasteCategory { Minimal, Small, Medium, Large, Excessive };

inline constexpr int kWasteCategoryCount = 5;

const char* wasteCategoryLabel(WasteCategory category);

WasteCategory categorizeWaste(Millimeters remainder, const WastePolicy& policy);

// Remainder long enough to go back to the rack as stock
bool isReclaimableWaste(Millimeters remainder, const WastePolicy& policy);

// One placed piece inside a Cut
struct Segment {
    int itemIndex = -1; // Index of the source CutItem in the run's input list
    std::string itemId;
    std::string workOrderId;
    Millimeters length = 0.0;      // Placed length, within the item's tolerance
    Millimeters position = 0.0;    // Distance from the bar start
    Millimeters endPosition = 0.0; // position + length
    int sequenceNumber = 0;        // 1-based, left to right
    bool toleranceAdjusted = false;
};

// Pieces of one work order on a bar
struct WorkOrderShare {
    std::string workOrderId;
    int pieces = 0;
    Millimeters length = 0.0;
};

// One consumed stock bar and its layout
struct Cut {
    std::string profileType;
    Millimeters stockLength = 0.0;
    std::vector<Segment> segments;

    Millimeters usedLength = 0.0;      // Sum of segment lengths
    Millimeters kerfLoss = 0.0;        // kerf x segment count
    Millimeters trimLoss = 0.0;        // Safety allowance at the bar ends
    Millimeters remainingLength = 0.0; // stock - used - kerf - trim

    WasteCategory wasteCategory = WasteCategory::Minimal;
    bool isReclaimable = false;

    std::vector<WorkOrderShare> workOrderBreakdown;
    bool isMixed = false; // Carries pieces of more than one work order

    int segmentCount() const { return static_cast<int>(segments.size()); }

    // Stock length plus ordered piece lengths; equal keys need no re-setup
    std::string patternKey() const;
};

} // namespace optimizer
} // namespace sc

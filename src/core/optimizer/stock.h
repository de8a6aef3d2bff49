#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../types.h"

namespace sc {
namespace optimizer {

// One required piece of an extrusion profile
struct CutItem {
    std::string id;
    std::string profileType;  // Material family, e.g. "AL-6063-40x40"
    std::string workOrderId;  // Empty when the item belongs to no order
    Millimeters length = 0.0;
    int quantity = 1;
    Millimeters tolerance = 0.0; // Allowed under/over length
    std::optional<int> priority;

    CutItem() = default;
    CutItem(std::string id_, std::string profile, Millimeters len, int qty,
            Millimeters tol = 0.0)
        : id(std::move(id_)), profileType(std::move(profile)), length(len), quantity(qty),
          tolerance(tol) {}

    Millimeters minLength() const { return length - tolerance; }
    Millimeters maxLength() const { return length + tolerance; }
};

// A purchasable raw bar
struct StockOption {
    std::string profileType;
    Millimeters stockLength = 0.0;
    int priority = 0;  // Lower is preferred
    bool isDefault = false;
    std::string name;  // e.g. "6m bar"

    StockOption() = default;
    StockOption(std::string profile, Millimeters len, int prio = 0, bool def = false)
        : profileType(std::move(profile)), stockLength(len), priority(prio), isDefault(def) {}
};

// Stock options keyed by profile type
class StockCatalog {
  public:
    StockCatalog() = default;
    explicit StockCatalog(const std::vector<StockOption>& options);

    void add(const StockOption& option);

    bool hasProfile(const std::string& profileType) const;

    // Options for one profile, empty when the profile is unknown
    const std::vector<StockOption>& optionsFor(const std::string& profileType) const;

    std::vector<std::string> profiles() const;
    usize size() const;
    bool empty() const { return m_options.empty(); }

  private:
    std::map<std::string, std::vector<StockOption>> m_options;
};

// Sort options by preference: priority first, then stock length, then input order
std::vector<StockOption> sortByPreference(const std::vector<StockOption>& options);

// Group item indices by profile type (profiles in first-seen order)
std::vector<std::pair<std::string, std::vector<int>>>
groupByProfile(const std::vector<CutItem>& items);

} // namespace optimizer
} // namespace sc

#include "stock.h"

#include <algorithm>

namespace sc {
namespace optimizer {

StockCatalog::StockCatalog(const std::vector<StockOption>& options) {
    for (const auto& option : options) {
        add(option);
    }
}

void StockCatalog::add(const StockOption& option) {
    m_options[option.profileType].push_back(option);
}

bool StockCatalog::hasProfile(const std::string& profileType) const {
    auto it = m_options.find(profileType);
    return it != m_options.end() && !it->second.empty();
}

const std::vector<StockOption>& StockCatalog::optionsFor(const std::string& profileType) const {
    static const std::vector<StockOption> kEmpty;
    auto it = m_options.find(profileType);
    return it == m_options.end() ? kEmpty : it->second;
}

std::vector<std::string> StockCatalog::profiles() const {
    std::vector<std::string> names;
    names.reserve(m_options.size());
    for (const auto& [profile, options] : m_options) {
        names.push_back(profile);
    }
    return names;
}

usize StockCatalog::size() const {
    usize total = 0;
    for (const auto& [profile, options] : m_options) {
        total += options.size();
    }
    return total;
}

std::vector<StockOption> sortByPreference(const std::vector<StockOption>& options) {
    std::vector<StockOption> sorted = options;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const StockOption& a, const StockOption& b) {
                         if (a.priority != b.priority) {
                             return a.priority < b.priority;
                         }
                         return a.stockLength < b.stockLength;
                     });
    return sorted;
}

std::vector<std::pair<std::string, std::vector<int>>>
groupByProfile(const std::vector<CutItem>& items) {
    std::vector<std::pair<std::string, std::vector<int>>> groups;
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        const auto& profile = items[i].profileType;
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& g) { return g.first == profile; });
        if (it == groups.end()) {
            groups.push_back({profile, {i}});
        } else {
            it->second.push_back(i);
        }
    }
    return groups;
}

} // namespace optimizer
} // namespace sc

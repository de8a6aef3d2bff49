#include "errors.h"

#include <sstream>

namespace sc {
namespace optimizer {

namespace {

constexpr usize kMaxListedIds = 8;

template <typename T, typename F>
std::string listIds(const std::vector<T>& values, F&& idOf) {
    std::ostringstream ss;
    for (usize i = 0; i < values.size() && i < kMaxListedIds; ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << idOf(values[i]);
    }
    if (values.size() > kMaxListedIds) {
        ss << " (+" << values.size() - kMaxListedIds << " more)";
    }
    return ss.str();
}

std::string tooLongMessage(const std::vector<ItemTooLongError::Offender>& offenders) {
    return "Items longer than every available stock option: " +
           listIds(offenders, [](const auto& o) { return o.itemId; });
}

std::string missingStockMessage(const std::vector<std::string>& profiles) {
    return "No stock options for profile type(s): " +
           listIds(profiles, [](const std::string& p) { return p; });
}

std::string infeasibleMessage(const std::vector<InfeasibleConstraintError::Violation>& v) {
    if (v.empty()) {
        return "Infeasible constraint";
    }
    std::string message = "Infeasible item " + v.front().itemId + ": " + v.front().reason;
    if (v.size() > 1) {
        message += " (+" + std::to_string(v.size() - 1) + " more)";
    }
    return message;
}

} // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::EmptyInput:
        return "EmptyInputError";
    case ErrorKind::ItemTooLong:
        return "ItemTooLongError";
    case ErrorKind::MissingStockOption:
        return "MissingStockOptionError";
    case ErrorKind::InfeasibleConstraint:
        return "InfeasibleConstraintError";
    case ErrorKind::InvalidConfig:
        return "InvalidConfigError";
    case ErrorKind::Cancelled:
        return "OptimizationCancelledError";
    }
    return "OptimizationError";
}

ItemTooLongError::ItemTooLongError(std::vector<Offender> offenders)
    : OptimizationError(ErrorKind::ItemTooLong, tooLongMessage(offenders)),
      m_offenders(std::move(offenders)) {}

std::vector<std::string> ItemTooLongError::itemIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_offenders.size());
    for (const auto& o : m_offenders) {
        ids.push_back(o.itemId);
    }
    return ids;
}

MissingStockOptionError::MissingStockOptionError(std::vector<std::string> profileTypes)
    : OptimizationError(ErrorKind::MissingStockOption, missingStockMessage(profileTypes)),
      m_profileTypes(std::move(profileTypes)) {
    if (m_profileTypes.empty()) {
        m_profileTypes.emplace_back();
    }
}

InfeasibleConstraintError::InfeasibleConstraintError(std::vector<Violation> violations)
    : OptimizationError(ErrorKind::InfeasibleConstraint, infeasibleMessage(violations)),
      m_violations(std::move(violations)) {
    if (m_violations.empty()) {
        m_violations.push_back({"", "unspecified"});
    }
}

InvalidConfigError::InvalidConfigError(std::string field, std::string reason)
    : OptimizationError(ErrorKind::InvalidConfig,
                        "Invalid configuration '" + field + "': " + reason),
      m_field(std::move(field)), m_reason(std::move(reason)) {}

} // namespace optimizer
} // namespace sc

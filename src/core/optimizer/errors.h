#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "../types.h"

namespace sc {
namespace optimizer {

enum class ErrorKind {
    EmptyInput,
    ItemTooLong,
    MissingStockOption,
    InfeasibleConstraint,
    InvalidConfig,
    Cancelled,
};

const char* errorKindName(ErrorKind kind);

// Base of every error an optimization run can fail with.
// Each subclass carries the offending identifiers as fields.
class OptimizationError : public std::runtime_error {
  public:
    OptimizationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

  private:
    ErrorKind m_kind;
};

class EmptyInputError : public OptimizationError {
  public:
    EmptyInputError() : OptimizationError(ErrorKind::EmptyInput, "No cut items to optimize") {}
};

// One or more requests exceed every available stock option's usable length
class ItemTooLongError : public OptimizationError {
  public:
    struct Offender {
        std::string itemId;
        std::string profileType;
        Millimeters length = 0.0;
        Millimeters maxUsableLength = 0.0;
    };

    explicit ItemTooLongError(std::vector<Offender> offenders);

    const std::vector<Offender>& offenders() const { return m_offenders; }
    std::vector<std::string> itemIds() const;

  private:
    std::vector<Offender> m_offenders;
};

class MissingStockOptionError : public OptimizationError {
  public:
    explicit MissingStockOptionError(std::vector<std::string> profileTypes);

    // First missing profile
    const std::string& profileType() const { return m_profileTypes.front(); }
    const std::vector<std::string>& profileTypes() const { return m_profileTypes; }

  private:
    std::vector<std::string> m_profileTypes;
};

class InfeasibleConstraintError : public OptimizationError {
  public:
    struct Violation {
        std::string itemId;
        std::string reason;
    };

    explicit InfeasibleConstraintError(std::vector<Violation> violations);

    const std::vector<Violation>& violations() const { return m_violations; }
    const std::string& itemId() const { return m_violations.front().itemId; }
    const std::string& reason() const { return m_violations.front().reason; }

  private:
    std::vector<Violation> m_violations;
};

class InvalidConfigError : public OptimizationError {
  public:
    InvalidConfigError(std::string field, std::string reason);

    const std::string& field() const { return m_field; }
    const std::string& reason() const { return m_reason; }

  private:
    std::string m_field;
    std::string m_reason;
};

class OptimizationCancelledError : public OptimizationError {
  public:
    explicit OptimizationCancelledError(const std::string& where)
        : OptimizationError(ErrorKind::Cancelled, "Optimization cancelled during " + where) {}
};

} // namespace optimizer
} // namespace sc

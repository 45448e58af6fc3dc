#pragma once

#include <stdexcept>
#include <string>

namespace fpl_core {

// Raw player record is missing a required field or carries a bad value.
class DataValidationError : public std::invalid_argument {
public:
  explicit DataValidationError(const std::string &what)
      : std::invalid_argument(what) {}
};

class DuplicatePlayerError : public std::invalid_argument {
public:
  explicit DuplicatePlayerError(const std::string &what)
      : std::invalid_argument(what) {}
};

// League rules or formation rules that cannot describe a legal squad.
class InvalidConfigurationError : public std::invalid_argument {
public:
  explicit InvalidConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Player pool or squad that cannot be used as given (too few eligible
// players for a quota, a hand-built squad breaking the rules, ...).
class InvalidInputError : public std::invalid_argument {
public:
  explicit InvalidInputError(const std::string &what)
      : std::invalid_argument(what) {}
};

// No subset of the catalog satisfies every constraint.
class InfeasibleError : public std::runtime_error {
public:
  explicit InfeasibleError(const std::string &what)
      : std::runtime_error(what) {}
};

// Search budget ran out before optimality was proven.
class TimeoutError : public std::runtime_error {
public:
  explicit TimeoutError(const std::string &what) : std::runtime_error(what) {}
};

// Squad composition admits no legal formation. Only reachable when an
// upstream squad invariant was broken.
class NoValidFormationError : public std::logic_error {
public:
  explicit NoValidFormationError(const std::string &what)
      : std::logic_error(what) {}
};

} // namespace fpl_core

#pragma once
#include <stdexcept>
#include <string>

// Raised when raw physiological data (sensor samples, strain readings) is
// handed to an export path. Always fatal to the attempted operation.
class PolicyViolation : public std::runtime_error {
public:
  PolicyViolation(const std::string& category, const std::string& detail)
    : std::runtime_error("privacy policy violation [" + category + "]: " + detail),
      category_(category) {}

  const std::string& category() const { return category_; }

private:
  std::string category_;
};

// A SetRecord was edited after its feedback window closed.
class SetLockedError : public std::runtime_error {
public:
  explicit SetLockedError(const std::string& what) : std::runtime_error(what) {}
};

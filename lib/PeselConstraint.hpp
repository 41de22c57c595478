#ifndef PESEL_VALIDATION_PESEL_CONSTRAINT_H_
#define PESEL_VALIDATION_PESEL_CONSTRAINT_H_

#include <memory>
#include <string>

#include "PeselValidator.hpp"

// What a declarative validation framework needs from a constraint: a check
// on the candidate value and the message to show when it fails.
class PeselConstraint_Base {
 public:
  virtual ~PeselConstraint_Base() {}

  virtual bool Check(const std::string& value) const = 0;

  virtual const std::string& Message() const = 0;
};

// Adapts PeselValidator to PeselConstraint_Base. The policy is fixed when the
// framework configures the constraint.
class PeselConstraint : public PeselConstraint_Base {
 public:
  bool Check(const std::string& value) const override {
    return PeselValidator::IsValid(value, policy_);
  }

  const std::string& Message() const override {
    return message_;
  }

  const PeselValidationPolicy& policy() const {
    return policy_;
  }

  static const std::string& DefaultMessage() {
    static const std::string message = "must be a valid PESEL number";
    return message;
  }

  static std::unique_ptr<PeselConstraint_Base> Configure(
      const PeselValidationPolicy& policy) {
    return Configure(policy, DefaultMessage());
  }

  static std::unique_ptr<PeselConstraint_Base> Configure(
      const PeselValidationPolicy& policy, const std::string& message) {
    return std::unique_ptr<PeselConstraint_Base>(
        new PeselConstraint(policy, message));
  }

 private:
  PeselConstraint(const PeselValidationPolicy& policy,
                  const std::string& message)
      : policy_(policy), message_(message) {}

  PeselValidationPolicy policy_;
  std::string message_;
};

#endif  // PESEL_VALIDATION_PESEL_CONSTRAINT_H_

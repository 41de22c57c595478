#ifndef PESEL_VALIDATION_PESEL_INPUT_DOMAIN_ERROR_H_
#define PESEL_VALIDATION_PESEL_INPUT_DOMAIN_ERROR_H_

#include <stdexcept>
#include <string>

// Thrown by the generation path when asked for something that has no PESEL
// encoding, e.g. a birth year outside of the century bands. Untrusted input
// on the validation path never ends up here, it just makes IsValid() false.
class PeselInputDomainError : public std::invalid_argument {
 public:
  PeselInputDomainError(const std::string& code, const std::string& message)
      : std::invalid_argument(message), code_(code) {}

  // Short machine readable code, e.g. "YEAR_OUT_OF_RANGE".
  const std::string& code() const {
    return code_;
  }

 private:
  std::string code_;
};

#endif  // PESEL_VALIDATION_PESEL_INPUT_DOMAIN_ERROR_H_

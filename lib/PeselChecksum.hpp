#ifndef PESEL_VALIDATION_PESEL_CHECKSUM_H_
#define PESEL_VALIDATION_PESEL_CHECKSUM_H_

#include <cctype>
#include <string>

// Weighted check digit of a PESEL number. Having a PESEL in the form of
// ABCDEFGHIJK the check digit is
//   K = (10 - (A*1 + B*3 + C*7 + D*9 + E*1 + F*3 + G*7 + H*9 + I*1 + J*3)) % 10
// with the inner sum taken modulo 10 first.
class PeselChecksum {
 public:
  // Length of a complete PESEL, check digit included.
  static const size_t kLength = 11;

  // Returns true if the supplied string is exactly 11 ASCII digits. Says
  // nothing about the checksum or the date.
  static bool IsWellFormed(const std::string& pesel) {
    if (pesel.size() != kLength) {
      return false;
    }
    for (char c : pesel) {
      if (!isdigit((unsigned char) c)) {
        return false;
      }
    }
    return true;
  }

  // Computes the check digit of the first ten characters of digits. The
  // caller has to make sure these are all ASCII digits.
  static int ComputeCheckDigit(const std::string& digits) {
    int checksum = 0;
    for (size_t i = 0; i < kLength - 1; ++i) {
      checksum += Weight(i) * (int) (digits[i] - '0');
    }
    checksum %= 10;
    return (10 - checksum) % 10;
  }

  // Checks whether the supplied pesel is well formed and ends with the right
  // check digit.
  static bool IsValid(const std::string& pesel) {
    if (!IsWellFormed(pesel)) {
      // Wrong length or at least one non-digit character.
      return false;
    }
    int actual_check_digit = (int) (pesel[kLength - 1] - '0');
    return ComputeCheckDigit(pesel) == actual_check_digit;
  }

 private:
  static int Weight(size_t position) {
    static const int weights[kLength - 1] = {1, 3, 7, 9, 1, 3, 7, 9, 1, 3};
    return weights[position];
  }
};

#endif  // PESEL_VALIDATION_PESEL_CHECKSUM_H_

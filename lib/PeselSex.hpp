#ifndef PESEL_VALIDATION_PESEL_SEX_H_
#define PESEL_VALIDATION_PESEL_SEX_H_

#include <iostream>
#include <string>

#include "PeselChecksum.hpp"

enum class Sex { kFemale, kMale };

// Which digit carries the sex. The documented scheme (and the generator) use
// the last serial digit. kCheckDigit reproduces older validators that read
// the check digit instead; the two disagree on plenty of real numbers.
enum class PeselSexDigit { kSerial, kCheckDigit };

class PeselSex {
 public:
  // Odd digits are male, even digits are female.
  static Sex FromDigit(int digit) {
    return digit % 2 == 1 ? Sex::kMale : Sex::kFemale;
  }

  // Reads the sex out of a well formed pesel. The checksum and date are not
  // looked at. Returns false (and leaves sex alone) if pesel is not 11 digits.
  static bool SexOf(const std::string& pesel, Sex* sex,
                    PeselSexDigit digit = PeselSexDigit::kSerial) {
    if (!PeselChecksum::IsWellFormed(pesel)) {
      std::cerr << "PeselSex::SexOf called with \"" << pesel << "\", which is"
                << " not 11 digits long." << std::endl;
      return false;
    }
    size_t position = digit == PeselSexDigit::kSerial ? 9 : 10;
    *sex = FromDigit((int) (pesel[position] - '0'));
    return true;
  }

  static bool IsMale(const std::string& pesel,
                     PeselSexDigit digit = PeselSexDigit::kSerial) {
    Sex sex;
    return SexOf(pesel, &sex, digit) && sex == Sex::kMale;
  }

  static bool IsFemale(const std::string& pesel,
                       PeselSexDigit digit = PeselSexDigit::kSerial) {
    Sex sex;
    return SexOf(pesel, &sex, digit) && sex == Sex::kFemale;
  }

  static std::string Name(Sex sex) {
    return sex == Sex::kMale ? "male" : "female";
  }

  // Parses "male" or "female".
  static bool FromName(const std::string& name, Sex* sex) {
    if (name == "male") {
      *sex = Sex::kMale;
    } else if (name == "female") {
      *sex = Sex::kFemale;
    } else {
      return false;
    }
    return true;
  }
};

#endif  // PESEL_VALIDATION_PESEL_SEX_H_

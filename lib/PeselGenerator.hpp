#ifndef PESEL_VALIDATION_PESEL_GENERATOR_H_
#define PESEL_VALIDATION_PESEL_GENERATOR_H_

#include <cstdio>
#include <string>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "PeselChecksum.hpp"
#include "PeselDateCodec.hpp"
#include "PeselInputDomainError.hpp"
#include "PeselRandom_Base.hpp"
#include "PeselRandom_MT19937.hpp"
#include "PeselSex.hpp"
#include "PeselValidator.hpp"

class PeselGenerator {
 public:
  // Draws from the process wide source.
  PeselGenerator() : random_(&PeselRandom_MT19937::Shared()) {}

  // random is not owned and has to outlive the generator.
  explicit PeselGenerator(PeselRandom_Base* random) : random_(random) {}

  // Builds a pesel for the supplied birth date and sex with a random serial.
  // Future dates are fine here, validation policy is a separate concern.
  // Throws PeselInputDomainError if the year cannot be encoded.
  std::string Generate(const boost::gregorian::date& birth_date, Sex sex) {
    std::string pesel = PeselDateCodec::Encode(birth_date);

    int serial = AdjustSerial(random_->UniformInt(0, 9999), sex);
    char serial_digits[5];
    snprintf(serial_digits, sizeof(serial_digits), "%04d", serial);
    pesel += serial_digits;

    pesel += (char) ('0' + PeselChecksum::ComputeCheckDigit(pesel));
    return pesel;
  }

  // Random sex, random birth date between 1850-01-01 and today.
  std::string Generate() {
    return GenerateWithin(PeselValidator::Epoch(),
                          boost::gregorian::day_clock::local_day());
  }

  // Random sex, random birth date anywhere from the first day of from_year
  // to the last day of to_year.
  std::string GenerateBetween(int from_year, int to_year) {
    if (from_year > to_year) {
      throw PeselInputDomainError(
          "INVALID_YEAR_RANGE",
          "Year range " + std::to_string(from_year) + ".." +
              std::to_string(to_year) + " is empty.");
    }
    // Throws for years without a band.
    PeselDateCodec::BandForYear(from_year);
    PeselDateCodec::BandForYear(to_year);
    return GenerateWithin(boost::gregorian::date(from_year, 1, 1),
                          boost::gregorian::date(to_year, 12, 31));
  }

  // Fixes the parity of the last serial digit so that it codes sex. A 9 that
  // has to become even goes down to 8 to keep the serial within four digits.
  static int AdjustSerial(int serial, Sex sex) {
    if (PeselSex::FromDigit(serial % 10) == sex) {
      return serial;
    }
    return serial % 10 == 9 ? serial - 1 : serial + 1;
  }

 private:
  std::string GenerateWithin(const boost::gregorian::date& first,
                             const boost::gregorian::date& last) {
    int span = (int) (last - first).days();
    boost::gregorian::date birth_date =
        first + boost::gregorian::days(random_->UniformInt(0, span));
    Sex sex = random_->Bernoulli() ? Sex::kMale : Sex::kFemale;
    return Generate(birth_date, sex);
  }

  PeselRandom_Base* random_;
};

#endif  // PESEL_VALIDATION_PESEL_GENERATOR_H_

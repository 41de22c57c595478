#ifndef PESEL_VALIDATION_PESEL_VALIDATOR_H_
#define PESEL_VALIDATION_PESEL_VALIDATOR_H_

#include <string>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "PeselChecksum.hpp"
#include "PeselDateCodec.hpp"

// What a decoded birth date is allowed to be. The default is strict: no
// birth dates after today and none before 1850-01-01.
struct PeselValidationPolicy {
  bool allow_future_dates = false;
  bool allow_dates_before_1850 = false;
};

// PESEL numbers have the form YYMMDDZZZXQ: YYMMDD is the date of birth (with
// the century encoded in the month field), ZZZX is a serial where X is odd
// for males and even for females, and Q is the check digit.
class PeselValidator {
 public:
  // Earliest birth date accepted under a strict policy.
  static boost::gregorian::date Epoch() {
    return boost::gregorian::date(1850, 1, 1);
  }

  // Strict validation against the local date.
  static bool IsValid(const std::string& pesel) {
    return IsValid(pesel, PeselValidationPolicy());
  }

  static bool IsValid(const std::string& pesel,
                      const PeselValidationPolicy& policy) {
    return IsValid(pesel, policy, boost::gregorian::day_clock::local_day());
  }

  // A null pesel is never valid.
  static bool IsValid(const char* pesel,
                      const PeselValidationPolicy& policy =
                          PeselValidationPolicy()) {
    if (pesel == nullptr) {
      return false;
    }
    return IsValid(std::string(pesel), policy);
  }

  // Checks, in this order and stopping at the first failure, the checksum,
  // the encoded birth date and the policy, with today as the cut off for
  // future dates.
  static bool IsValid(const std::string& pesel,
                      const PeselValidationPolicy& policy,
                      const boost::gregorian::date& today) {
    boost::gregorian::date birth_date;
    if (!BirthDateOf(pesel, &birth_date)) {
      return false;
    }
    if (!policy.allow_future_dates && birth_date > today) {
      return false;
    }
    if (!policy.allow_dates_before_1850 && birth_date < Epoch()) {
      return false;
    }
    return true;
  }

  static bool IsChecksumValid(const std::string& pesel) {
    return PeselChecksum::IsValid(pesel);
  }

  // Decodes the birth date of a pesel with a valid checksum, regardless of
  // any policy. Returns false if either step fails.
  static bool BirthDateOf(const std::string& pesel,
                          boost::gregorian::date* birth_date) {
    if (!PeselChecksum::IsValid(pesel)) {
      return false;
    }
    return PeselDateCodec::Decode(pesel, birth_date);
  }
};

#endif  // PESEL_VALIDATION_PESEL_VALIDATOR_H_

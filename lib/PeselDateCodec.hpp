#ifndef PESEL_VALIDATION_PESEL_DATE_CODEC_H_
#define PESEL_VALIDATION_PESEL_DATE_CODEC_H_

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "PeselInputDomainError.hpp"

// The century of a birth date is stored in the month field: each band adds
// its own offset to the real month.
struct PeselCenturyBand {
  // Encoded months strictly greater than this belong to the band.
  int threshold;
  // First year of the century the band covers.
  int year_base;
  // Added to the real month when encoding.
  int month_offset;
};

// Converts between a birth date and the YYMMDD prefix of a PESEL.
class PeselDateCodec {
 public:
  // Encodable birth years are [kFirstYear, kEndYear).
  enum { kFirstYear = 1800, kEndYear = 2300 };

  // Bands ordered from the highest offset down. Decoding takes the first band
  // whose threshold is exceeded, so the order matters.
  static const std::vector<PeselCenturyBand>& Bands() {
    static const std::vector<PeselCenturyBand> bands = {
      {80, 1800, 80},
      {60, 2200, 60},
      {40, 2100, 40},
      {20, 2000, 20},
      {0, 1900, 0},
    };
    return bands;
  }

  // Decodes the first six digits of encoded into a calendar date. Returns
  // false if they are not digits, the month is outside of every band or the
  // day does not exist in that month. birth_date is only written on success.
  static bool Decode(const std::string& encoded,
                     boost::gregorian::date* birth_date) {
    if (encoded.size() < 6) {
      return false;
    }
    for (size_t i = 0; i < 6; ++i) {
      if (!isdigit((unsigned char) encoded[i])) {
        return false;
      }
    }

    int year = TwoDigits(encoded, 0);
    int month = TwoDigits(encoded, 2);
    int day = TwoDigits(encoded, 4);

    for (const PeselCenturyBand& band : Bands()) {
      if (month <= band.threshold) {
        continue;
      }
      // Bad month or day of month both derive from std::out_of_range.
      try {
        *birth_date = boost::gregorian::date(band.year_base + year,
                                             month - band.month_offset, day);
      } catch (const std::out_of_range&) {
        return false;
      }
      return true;
    }

    // Month 00 does not belong to any band.
    return false;
  }

  // Encodes birth_date as YYMMDD with the century folded into the month.
  // Throws PeselInputDomainError if the year has no band.
  static std::string Encode(const boost::gregorian::date& birth_date) {
    int year = birth_date.year();
    const PeselCenturyBand& band = BandForYear(year);

    char encoded[7];
    snprintf(encoded, sizeof(encoded), "%02d%02d%02d", year % 100,
             (int) birth_date.month() + band.month_offset,
             (int) birth_date.day());
    return std::string(encoded);
  }

  static bool IsEncodableYear(int year) {
    return year >= kFirstYear && year < kEndYear;
  }

  static const PeselCenturyBand& BandForYear(int year) {
    for (const PeselCenturyBand& band : Bands()) {
      if (year >= band.year_base && year < band.year_base + 100) {
        return band;
      }
    }
    throw PeselInputDomainError(
        "YEAR_OUT_OF_RANGE",
        "Birth year " + std::to_string(year) + " must be between " +
            std::to_string((int) kFirstYear) + " and " +
            std::to_string((int) kEndYear - 1) + ".");
  }

 private:
  static int TwoDigits(const std::string& s, size_t pos) {
    return (int) (s[pos] - '0') * 10 + (int) (s[pos + 1] - '0');
  }
};

#endif  // PESEL_VALIDATION_PESEL_DATE_CODEC_H_

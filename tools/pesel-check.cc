#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "PeselSex.hpp"
#include "PeselValidator.hpp"

void PrintUsage() {
  std::cerr << "Usage: ./pesel-check pesel [allow_future] [allow_before_1850]"
            << " [quiet|verbose]" << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 2 || argc > 5) {
    PrintUsage();
    exit(1);
  }

  std::string pesel(argv[1]);

  // Sort out the optional args.
  PeselValidationPolicy policy;
  bool quiet = false, verbose = false;
  for (int i = 2; i < argc; ++i) {
    if (strcmp(argv[i], "allow_future") == 0) {
      policy.allow_future_dates = true;
    } else if (strcmp(argv[i], "allow_before_1850") == 0) {
      policy.allow_dates_before_1850 = true;
    } else if (strcmp(argv[i], "quiet") == 0) {
      quiet = true;
    } else if (strcmp(argv[i], "verbose") == 0) {
      verbose = true;
    } else {
      std::cerr << "Unknown option \"" << argv[i] << "\"." << std::endl;
      PrintUsage();
      exit(1);
    }
  }
  if (quiet && verbose) {
    PrintUsage();
    exit(1);
  }

  bool result = PeselValidator::IsValid(pesel, policy);
  if (!quiet) {
    std::cout << (result ? "true" : "false") << std::endl;
  }
  if (result && verbose) {
    boost::gregorian::date birth_date;
    Sex sex;
    if (PeselValidator::BirthDateOf(pesel, &birth_date) &&
        PeselSex::SexOf(pesel, &sex)) {
      std::cout << "Birth date: "
                << boost::gregorian::to_iso_extended_string(birth_date)
                << std::endl;
      std::cout << "Sex: " << PeselSex::Name(sex) << std::endl;
    }
  }

  return result ? 0 : 2;
}

#include <iostream>
#include <string>
#include <cstdlib>
#include <exception>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "PeselGenerator.hpp"
#include "PeselInputDomainError.hpp"
#include "PeselSex.hpp"

void PrintUsage() {
  std::cerr << "Usage: ./pesel-gen [YYYY-MM-DD male|female | from_year to_year]"
            << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc != 1 && argc != 3) {
    PrintUsage();
    exit(1);
  }

  PeselGenerator generator;

  // No arguments: anyone born between 1850 and today.
  if (argc == 1) {
    std::cout << generator.Generate() << std::endl;
    return 0;
  }

  std::string first(argv[1]);
  std::string second(argv[2]);

  try {
    Sex sex;
    if (PeselSex::FromName(second, &sex)) {
      boost::gregorian::date birth_date =
          boost::gregorian::from_simple_string(first);
      std::cout << generator.Generate(birth_date, sex) << std::endl;
    } else {
      int from_year = atoi(first.c_str());
      int to_year = atoi(second.c_str());
      std::cout << generator.GenerateBetween(from_year, to_year) << std::endl;
    }
  } catch (const PeselInputDomainError& e) {
    std::cerr << e.code() << ": " << e.what() << std::endl;
    exit(1);
  } catch (const std::exception& e) {
    // Anything boost could not parse as a date.
    std::cerr << "Bad birth date \"" << first << "\": " << e.what()
              << std::endl;
    PrintUsage();
    exit(1);
  }

  return 0;
}

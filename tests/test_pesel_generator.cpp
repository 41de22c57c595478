/**
 * @file test_pesel_generator.cpp
 * @brief Unit tests for PeselGenerator — synthesis of valid PESEL numbers
 *
 * Uses ScriptedRandom for exact outputs and the shared MT19937 source for
 * property checks.
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "PeselGenerator.hpp"
#include "PeselRandom_MT19937.hpp"
#include "PeselSex.hpp"
#include "PeselValidator.hpp"
#include "test_helpers.h"

using namespace test_helpers;
using boost::gregorian::date;

class PeselGeneratorTest : public ::testing::Test {
protected:
  ScriptedRandom scripted_;
  PeselGenerator generator_{&scripted_};
};

// ============================================================================
// Exact outputs
// ============================================================================

TEST_F(PeselGeneratorTest, Generate_KnownNumber) {
  scripted_.ints = {135};
  EXPECT_EQ(generator_.Generate(Date(1944, 5, 14), Sex::kMale), "44051401359");
}

TEST_F(PeselGeneratorTest, Generate_FemaleBumpsOddSerial) {
  scripted_.ints = {135};
  EXPECT_EQ(generator_.Generate(Date(1944, 5, 14), Sex::kFemale), "44051401366");
}

TEST_F(PeselGeneratorTest, Generate_NineStepsDown) {
  scripted_.ints = {9999};
  EXPECT_EQ(generator_.Generate(Date(1944, 5, 14), Sex::kFemale), "44051499989");
}

TEST_F(PeselGeneratorTest, Generate_MaleBumpsEvenSerial) {
  scripted_.ints = {9998};
  EXPECT_EQ(generator_.Generate(Date(1944, 5, 14), Sex::kMale), "44051499996");
}

TEST_F(PeselGeneratorTest, Generate_ZeroSerialIsPadded) {
  scripted_.ints = {0};
  EXPECT_EQ(generator_.Generate(Date(1850, 1, 1), Sex::kFemale), "50810100007");
}

TEST_F(PeselGeneratorTest, Generate_LeapDayFemaleRoundTrips) {
  scripted_.ints = {4321};
  std::string pesel = generator_.Generate(Date(2000, 2, 29), Sex::kFemale);
  EXPECT_EQ(pesel, "00222943226");

  date birthDate;
  ASSERT_TRUE(PeselDateCodec::Decode(pesel, &birthDate));
  EXPECT_EQ(birthDate, Date(2000, 2, 29));
  EXPECT_TRUE(PeselValidator::IsChecksumValid(pesel));
  EXPECT_TRUE(PeselSex::IsFemale(pesel));
}

TEST_F(PeselGeneratorTest, Generate_FutureDateIsGeneratedButFailsStrictValidation) {
  scripted_.ints = {9999};
  std::string pesel = generator_.Generate(Date(2299, 12, 31), Sex::kMale);
  EXPECT_EQ(pesel, "99723199991");
  EXPECT_FALSE(PeselValidator::IsValid(pesel));
}

// ============================================================================
// Input domain errors
// ============================================================================

TEST_F(PeselGeneratorTest, Generate_Year1700Throws) {
  scripted_.ints = {1234};
  EXPECT_THROW(generator_.Generate(Date(1700, 1, 1), Sex::kMale), PeselInputDomainError);
}

TEST_F(PeselGeneratorTest, Generate_Year2300Throws) {
  scripted_.ints = {1234};
  EXPECT_THROW(generator_.Generate(Date(2300, 1, 1), Sex::kFemale), PeselInputDomainError);
}

TEST_F(PeselGeneratorTest, GenerateBetween_RejectsBadRanges) {
  EXPECT_THROW(generator_.GenerateBetween(2000, 1999), PeselInputDomainError);
  EXPECT_THROW(generator_.GenerateBetween(1799, 1900), PeselInputDomainError);
  EXPECT_THROW(generator_.GenerateBetween(1900, 2300), PeselInputDomainError);
}

TEST_F(PeselGeneratorTest, GenerateBetween_EmptyRangeCode) {
  try {
    generator_.GenerateBetween(2000, 1999);
    FAIL() << "expected PeselInputDomainError";
  } catch (const PeselInputDomainError& e) {
    EXPECT_EQ(e.code(), "INVALID_YEAR_RANGE");
  }
}

// ============================================================================
// Random dates and sexes
// ============================================================================

TEST_F(PeselGeneratorTest, GenerateBetween_ScriptedDayOffset) {
  // Day 59 of 2000 is 2000-02-29.
  scripted_.ints = {59, 4321};
  scripted_.coins = {false};
  EXPECT_EQ(generator_.GenerateBetween(2000, 2000), "00222943226");
}

TEST_F(PeselGeneratorTest, GenerateBetween_LastDayOfRange) {
  scripted_.ints = {364, 0};
  scripted_.coins = {true};
  std::string pesel = generator_.GenerateBetween(1985, 1985);

  date birthDate;
  ASSERT_TRUE(PeselValidator::BirthDateOf(pesel, &birthDate));
  EXPECT_EQ(birthDate, Date(1985, 12, 31));
  EXPECT_TRUE(PeselSex::IsMale(pesel));
}

TEST(PeselGeneratorRandomTest, Generate_AlwaysStrictlyValid) {
  PeselGenerator generator;
  for (int i = 0; i < 1000; ++i) {
    std::string pesel = generator.Generate();
    ASSERT_TRUE(PeselValidator::IsValid(pesel)) << pesel;
  }
}

TEST(PeselGeneratorRandomTest, Generate_PastDatesAreStrictlyValid) {
  PeselRandom_MT19937 random(20261018);
  PeselGenerator generator(&random);
  const date dates[] = {Date(1850, 1, 1), Date(1899, 12, 31), Date(1900, 1, 1),
                        Date(1999, 12, 31), Date(2000, 2, 29), Date(2024, 2, 29)};
  for (const date& d : dates) {
    EXPECT_TRUE(PeselValidator::IsValid(generator.Generate(d, Sex::kMale))) << d;
    EXPECT_TRUE(PeselValidator::IsValid(generator.Generate(d, Sex::kFemale))) << d;
  }
}

TEST(PeselGeneratorRandomTest, Generate_MaleRequestsAreAlwaysMale) {
  PeselGenerator generator;
  for (int i = 0; i < 1000; ++i) {
    std::string pesel = generator.Generate(Date(1990, 6, 1), Sex::kMale);
    ASSERT_TRUE(PeselSex::IsMale(pesel)) << pesel;
  }
}

TEST(PeselGeneratorRandomTest, Generate_FemaleRequestsAreAlwaysFemale) {
  PeselGenerator generator;
  for (int i = 0; i < 1000; ++i) {
    std::string pesel = generator.Generate(Date(1990, 6, 1), Sex::kFemale);
    ASSERT_TRUE(PeselSex::IsFemale(pesel)) << pesel;
  }
}

TEST(PeselGeneratorRandomTest, GenerateBetween_StaysInRange) {
  PeselGenerator generator;
  for (int i = 0; i < 200; ++i) {
    std::string pesel = generator.GenerateBetween(2100, 2101);
    date birthDate;
    ASSERT_TRUE(PeselValidator::BirthDateOf(pesel, &birthDate)) << pesel;
    EXPECT_GE(birthDate, Date(2100, 1, 1));
    EXPECT_LE(birthDate, Date(2101, 12, 31));
  }
}

TEST(PeselGeneratorRandomTest, SharedSource_ConcurrentCallers) {
  std::vector<std::thread> threads;
  std::vector<int> invalid(4, 0);
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t, &invalid] {
      PeselGenerator generator;
      for (int i = 0; i < 500; ++i) {
        if (!PeselValidator::IsValid(generator.Generate())) ++invalid[t];
      }
    });
  }
  for (auto& thread : threads) thread.join();
  for (int count : invalid) EXPECT_EQ(count, 0);
}

// ============================================================================
// Serial parity adjustment
// ============================================================================

TEST(PeselGeneratorParityTest, AdjustSerial) {
  EXPECT_EQ(PeselGenerator::AdjustSerial(135, Sex::kMale), 135);
  EXPECT_EQ(PeselGenerator::AdjustSerial(135, Sex::kFemale), 136);
  EXPECT_EQ(PeselGenerator::AdjustSerial(9999, Sex::kFemale), 9998);
  EXPECT_EQ(PeselGenerator::AdjustSerial(9998, Sex::kMale), 9999);
  EXPECT_EQ(PeselGenerator::AdjustSerial(0, Sex::kMale), 1);
  EXPECT_EQ(PeselGenerator::AdjustSerial(0, Sex::kFemale), 0);
}

#ifndef PESEL_VALIDATION_PESEL_RANDOM_MT19937_H_
#define PESEL_VALIDATION_PESEL_RANDOM_MT19937_H_

#include <cstdint>
#include <mutex>
#include <random>

#include "PeselRandom_Base.hpp"

// Mersenne twister behind a mutex, safe to share between threads.
class PeselRandom_MT19937 : public PeselRandom_Base {
 public:
  PeselRandom_MT19937() : mt_(std::random_device()()) {}

  explicit PeselRandom_MT19937(uint32_t seed) : mt_(seed) {}

  int UniformInt(int lo, int hi) override {
    std::uniform_int_distribution<int> dist(lo, hi);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(mt_);
  }

  bool Bernoulli() override {
    std::bernoulli_distribution dist(0.5);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(mt_);
  }

  // The process wide instance used when no source is handed to the
  // generator. Seeded once from std::random_device, never reseeded.
  static PeselRandom_MT19937& Shared() {
    static PeselRandom_MT19937 shared;
    return shared;
  }

 private:
  std::mutex mutex_;
  std::mt19937 mt_;
};

#endif  // PESEL_VALIDATION_PESEL_RANDOM_MT19937_H_

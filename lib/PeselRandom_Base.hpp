#ifndef PESEL_VALIDATION_PESEL_RANDOM_BASE_H_
#define PESEL_VALIDATION_PESEL_RANDOM_BASE_H_

// Source of randomness for the generator. Implementations shared between
// threads have to do their own locking.
class PeselRandom_Base {
 public:
  virtual ~PeselRandom_Base() {}

  // Uniformly distributed integer in [lo, hi], both ends included.
  virtual int UniformInt(int lo, int hi) = 0;

  // Fair coin flip.
  virtual bool Bernoulli() = 0;
};

#endif  // PESEL_VALIDATION_PESEL_RANDOM_BASE_H_

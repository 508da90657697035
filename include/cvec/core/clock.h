#pragma once

#include <cstdint>

namespace cvec::core {

// kTicksPerSecond: spin timestamps count 100-nanosecond ticks.
constexpr std::uint64_t kTicksPerSecond = 10'000'000;

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ITickClock {
 public:
  virtual ~ITickClock() = default;

  // Return the number of 100 ns ticks elapsed since the Unix epoch (UTC).
  virtual std::uint64_t now_ticks() = 0;

 protected:
  ITickClock() = default;
  ITickClock(const ITickClock&) = default;
  ITickClock& operator=(const ITickClock&) = default;
  ITickClock(ITickClock&&) = default;
  ITickClock& operator=(ITickClock&&) = default;
};

// Production clock: returns actual system time.
class SystemTickClock final : public ITickClock {
 public:
  SystemTickClock() = default;
  ~SystemTickClock() override = default;

  SystemTickClock(const SystemTickClock&) = default;
  SystemTickClock& operator=(const SystemTickClock&) = default;
  SystemTickClock(SystemTickClock&&) = default;
  SystemTickClock& operator=(SystemTickClock&&) = default;

  std::uint64_t now_ticks() override;
};

// Fixed clock: returns a constant tick count for deterministic tests.
class FixedTickClock final : public ITickClock {
 public:
  explicit FixedTickClock(std::uint64_t fixed_ticks) : fixed_ticks_(fixed_ticks) {}
  ~FixedTickClock() override = default;

  FixedTickClock(const FixedTickClock&) = default;
  FixedTickClock& operator=(const FixedTickClock&) = default;
  FixedTickClock(FixedTickClock&&) = default;
  FixedTickClock& operator=(FixedTickClock&&) = default;

  std::uint64_t now_ticks() override;

 private:
  std::uint64_t fixed_ticks_;
};

// default_tick_clock returns the process-wide SystemTickClock.
ITickClock& default_tick_clock();

}  // namespace cvec::core

#pragma once
#include <chrono>

class Clock {
public:
  virtual ~Clock() = default;
  virtual std::chrono::system_clock::time_point Now() const = 0;
};

class SystemClock : public Clock {
public:
  std::chrono::system_clock::time_point Now() const override { return std::chrono::system_clock::now(); }
  // Process-wide instance used when no clock is injected
  static const Clock& Instance();
};

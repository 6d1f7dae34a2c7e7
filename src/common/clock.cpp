#include "common/clock.hpp"

const Clock& SystemClock::Instance() {
  static SystemClock inst;
  return inst;
}

#include "kt/clock.h"

namespace kt {

Clock& DefaultClock() {
  static SystemClock clock;
  return clock;
}

}  // namespace kt

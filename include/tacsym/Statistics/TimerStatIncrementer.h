//===-- TimerStatIncrementer.h ----------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_TIMERSTATINCREMENTER_H
#define TACSYM_TIMERSTATINCREMENTER_H

#include "tacsym/Support/Timer.h"

#include <cstdint>

namespace tacsym {

/// Adds the lifetime of the object, in microseconds, to a statistic.
class TimerStatIncrementer {
  WallTimer timer;
  uint64_t &statistic;

public:
  explicit TimerStatIncrementer(uint64_t &_statistic)
      : statistic(_statistic) {}
  ~TimerStatIncrementer() { statistic += timer.check(); }

  uint64_t delta() const { return timer.check(); }
};

} // namespace tacsym

#endif /* TACSYM_TIMERSTATINCREMENTER_H */

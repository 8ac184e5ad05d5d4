//===-- Timer.h -------------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_TIMER_H
#define TACSYM_TIMER_H

#include <chrono>
#include <cstdint>

namespace tacsym {

class WallTimer {
  std::chrono::steady_clock::time_point start;

public:
  WallTimer() : start(std::chrono::steady_clock::now()) {}

  /// Elapsed wall time in microseconds.
  uint64_t check() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  }
};

} // namespace tacsym

#endif /* TACSYM_TIMER_H */

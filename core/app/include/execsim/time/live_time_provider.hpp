#pragma once

#include "execsim/time/i_time_provider.hpp"

namespace execsim {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock and converts to epoch ms.
//
// @details
// Used by BrokerEngine when the simulator runs in real time behind the
// TimerThread scheduler. system_clock::now() is safe to call from any
// thread, so no internal synchronization is needed.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace execsim

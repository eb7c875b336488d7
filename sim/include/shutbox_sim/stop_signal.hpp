#pragma once
#include "shutbox_sim/simulation_harness.hpp"

namespace shutbox_sim {

/**
 * Routes SIGINT to harness.request_stop() for the lifetime of the guard.
 *
 * The destructor detaches the harness and restores the previous SIGINT
 * handler, so no exit path leaves the handler pointing at a dead harness.
 * Only one guard may be active at a time (std::logic_error otherwise).
 */
class StopSignalGuard {
public:
  explicit StopSignalGuard(SimulationHarness& harness);
  ~StopSignalGuard();

  StopSignalGuard(const StopSignalGuard&) = delete;
  StopSignalGuard& operator=(const StopSignalGuard&) = delete;

private:
  using Handler = void (*)(int);
  Handler previous_;
};

} // namespace shutbox_sim

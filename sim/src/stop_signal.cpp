#include "shutbox_sim/stop_signal.hpp"
#include <atomic>
#include <csignal>
#include <stdexcept>

namespace shutbox_sim {

namespace {

std::atomic<SimulationHarness*> g_active_harness{nullptr};

void handle_stop_signal(int) {
  SimulationHarness* harness = g_active_harness.load();
  if (harness) {
    harness->request_stop();
  }
}

} // namespace

StopSignalGuard::StopSignalGuard(SimulationHarness& harness) {
  SimulationHarness* expected = nullptr;
  if (!g_active_harness.compare_exchange_strong(expected, &harness)) {
    throw std::logic_error("StopSignalGuard: another harness is already attached to SIGINT");
  }
  previous_ = std::signal(SIGINT, handle_stop_signal);
  if (previous_ == SIG_ERR) {
    g_active_harness.store(nullptr);
    throw std::runtime_error("StopSignalGuard: cannot install the SIGINT handler");
  }
}

StopSignalGuard::~StopSignalGuard() {
  std::signal(SIGINT, previous_);
  g_active_harness.store(nullptr);
}

} // namespace shutbox_sim

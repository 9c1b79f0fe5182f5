#include "app/crash_handler.hpp"

#include <cstdlib>

#ifdef __linux__
#include <array>
#include <csignal>
#include <iostream>
#include <stacktrace>
#include <string_view>
#include <unistd.h>
#endif

namespace app {

#ifdef __linux__
namespace {

struct FatalSignal {
  int number;
  std::string_view name;
};

constexpr std::array kFatalSignals = {
    FatalSignal{.number = SIGSEGV, .name = "SIGSEGV"},
    FatalSignal{.number = SIGFPE, .name = "SIGFPE"},
    FatalSignal{.number = SIGILL, .name = "SIGILL"},
    FatalSignal{.number = SIGBUS, .name = "SIGBUS"},
    FatalSignal{.number = SIGABRT, .name = "SIGABRT"},
};

auto SignalName(int sig) -> std::string_view {
  for (const auto& entry : kFatalSignals) {
    if (entry.number == sig) {
      return entry.name;
    }
  }
  return "unknown";
}

void HandleFatalSignal(int sig) noexcept {
  std::signal(sig, SIG_DFL);

  std::cerr << "\ntrilld: fatal signal " << sig << " (" << SignalName(sig)
            << ")\n";
  try {
    std::cerr << std::stacktrace::current() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "(stack trace unavailable: " << e.what() << ")\n";
  }
  std::cerr.flush();

  ::raise(sig);
}

}  // namespace
#endif

void InitializeCrashHandlers() {
#ifdef __linux__
  for (const auto& entry : kFatalSignals) {
    std::signal(entry.number, HandleFatalSignal);
  }
#endif
}

void WaitForDebuggerIfRequested() {
#ifdef __linux__
  if (std::getenv("WAIT_FOR_GDB") != nullptr) {
    std::raise(SIGSTOP);
  }
#endif
}

}  // namespace app

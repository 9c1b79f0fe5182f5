#pragma once

namespace app {

/// Prints a std::stacktrace to stderr on SIGSEGV, SIGFPE, SIGILL, SIGBUS and
/// SIGABRT, then re-raises the signal with the default action
void InitializeCrashHandlers();

/// Raises SIGSTOP when WAIT_FOR_GDB is set so a debugger can attach
void WaitForDebuggerIfRequested();

}  // namespace app

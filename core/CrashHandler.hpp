#pragma once

namespace CrashHandler {

// Installs backward-cpp signal handlers that print a symbolized stack trace
// on SIGSEGV/SIGABRT. Safe to call more than once.
void Init();

} // namespace CrashHandler

#include "CrashHandler.hpp"
#include "Log.hpp"
#include <backward.hpp>

namespace CrashHandler {

// Kept alive for the duration of the program.
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (!s_SignalHandler) {
    s_SignalHandler = new backward::SignalHandling();
    if (!s_SignalHandler->loaded()) {
      LOG_WARN("Crash handler could not install signal handlers");
    }
  }
}

} // namespace CrashHandler

#include "usage.h"

#include <sstream>

std::string UsageText(const char *argv0) {
  std::ostringstream out;
  out << "Usage: " << argv0 << " [--seed <n>] [--ticks <n>] [--world <1-8>] [--level <1-4>] [--realtime]\n";
  out << "\nOptions:\n";
  out << "  --seed <n>      Session seed for level generation (default 0 = random)\n";
  out << "  --ticks <n>     Number of 60 Hz ticks to simulate (default 3600, 0 = until the game ends)\n";
  out << "  --world <n>     Starting world (default 1)\n";
  out << "  --level <n>     Starting level within the world (default 1)\n";
  out << "  --log-every <n> Emit a HUD sample every n ticks (default 60, 0 = off)\n";
  out << "  --sim-config <path> Physics tuning JSON (default shared/sim/config.json)\n";
  out << "  --realtime      Pace ticks to wall-clock time instead of running flat out\n";
  out << "  --no-autoplay   Feed no input after starting the game\n";
  out << "  --dump-level    Print a deterministic level signature JSON and exit\n";
  out << "  -h, --help      Show this help text\n";
  return out.str();
}

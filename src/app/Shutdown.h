#pragma once

namespace app {

class CommandDispatcher;
class RefreshScheduler;

// Ends the process right away: drops pending commands, signals both timers,
// closes the log file and quick-exits. Gateway calls still in flight are
// abandoned rather than joined.
[[noreturn]] void exitImmediately(CommandDispatcher& dispatcher, RefreshScheduler& scheduler, int exitCode);

}  // namespace app

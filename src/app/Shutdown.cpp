#include "app/Shutdown.h"

#include "app/CommandDispatcher.h"
#include "app/RefreshScheduler.h"
#include "logging/Log.h"

#include <cstdio>
#include <cstdlib>

namespace app {

void exitImmediately(CommandDispatcher& dispatcher, RefreshScheduler& scheduler, int exitCode) {
    dispatcher.requestStop();
    scheduler.requestStop();
    LOG_INFO(logging::LogCategory::STATE, "Exiting without waiting for in-flight requests");
    logging::Log::close_file();
    std::fflush(nullptr);
    std::quick_exit(exitCode);
}

}  // namespace app

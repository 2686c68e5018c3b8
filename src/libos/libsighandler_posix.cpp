#include <LogCompat.hpp>
#include <array>
#include <csignal>

#include "libsighandler.hpp"

namespace {
constexpr std::array<int, 2> kHandledSignals{SIGINT, SIGTERM};
}  // namespace

std::atomic_bool SignalHandler::kUnderSignal;
std::atomic_int SignalHandler::kSignalNumber;

void SignalHandler::signalHandler(int signum) {
    if (kUnderSignal.exchange(true)) {
        std::signal(signum, SIG_DFL);
        return;
    }
    kSignalNumber = signum;
}

void SignalHandler::install() {
    for (const auto &sig : kHandledSignals) {
        if (std::signal(sig, SignalHandler::signalHandler) == SIG_ERR) {
            PLOG(ERROR) << "Failed to install signal handler";
        }
    }
}

void SignalHandler::uninstall() {
    for (const auto &sig : kHandledSignals) {
        if (std::signal(sig, SIG_DFL) == SIG_ERR) {
            PLOG(ERROR) << "Failed to uninstall signal handler";
        }
    }
}

#pragma once

#include <atomic>

// Turns SIGINT/SIGTERM into a flag the upload loop can poll.
class SignalHandler {
   public:
    /**
     * @brief Installs the handler for SIGINT and SIGTERM.
     *
     * A second signal after the first restores the default action, so a
     * stuck process can still be killed from the terminal.
     */
    static void install();

    // Restores the default action of the handled signals.
    static void uninstall();

    static bool isSignaled() { return kUnderSignal.load(); }
    // Number of the first signal received, 0 if none.
    static int signalNumber() { return kSignalNumber.load(); }

   private:
    static std::atomic_bool kUnderSignal;
    static std::atomic_int kSignalNumber;
    static void signalHandler(int signum);
};

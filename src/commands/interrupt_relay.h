// =============================================================================
// qzbulk - Interrupt Relay
// =============================================================================
// Decides what a SIGINT/SIGTERM does at each phase of the process:
// - while a command runs: cancel it; the run ends with status -1
// - after the command returned: ignore it; main is already shutting down
// - before any command started: exit with status -1 once the log is flushed
// =============================================================================

#ifndef QZB_COMMANDS_INTERRUPT_RELAY_H
#define QZB_COMMANDS_INTERRUPT_RELAY_H

#include <cstdint>
#include <mutex>

#include "commands/transfer_command.h"

namespace qzb::commands {

class InterruptRelay {
public:
    enum class Action : std::uint8_t {
        kCancelled,  ///< The active command was cancelled
        kIgnored,    ///< The run is over
        kExit        ///< Nothing to cancel; the caller exits the process
    };

    /// @brief Route signals to a command until detach().
    void attach(TransferCommand& command);

    /// @brief Stop routing signals; later signals are ignored.
    void detach() noexcept;

    /// @brief Handle one signal (signal handler thread).
    [[nodiscard]] Action onSignal();

private:
    std::mutex mutex_;
    TransferCommand* active_ = nullptr;
    bool finished_ = false;
};

}  // namespace qzb::commands

#endif  // QZB_COMMANDS_INTERRUPT_RELAY_H

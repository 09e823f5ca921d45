// =============================================================================
// qzbulk - Interrupt Relay Implementation
// =============================================================================

#include "commands/interrupt_relay.h"

namespace qzb::commands {

void InterruptRelay::attach(TransferCommand& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = &command;
}

void InterruptRelay::detach() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = nullptr;
    finished_ = true;
}

InterruptRelay::Action InterruptRelay::onSignal() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ != nullptr) {
        active_->cancel();
        return Action::kCancelled;
    }
    return finished_ ? Action::kIgnored : Action::kExit;
}

}  // namespace qzb::commands

// =============================================================================
// qzbulk - Interrupt Relay Tests
// =============================================================================

#include "commands/interrupt_relay.h"

#include <gtest/gtest.h>

#include "qzb/common/types.h"
#include "../support/temp_dir.h"

namespace qzb::commands::test {

namespace {

TransferOptions unreachableDump(const qzb::test::TempDir& dir) {
    TransferOptions options;
    options.database = "http://127.0.0.1:1/qizx/api";
    options.directory = dir / "out";
    options.timeoutSeconds = 2;
    return options;
}

}  // namespace

TEST(InterruptRelayTest, SignalBeforeAnyCommandExits) {
    InterruptRelay relay;
    EXPECT_EQ(relay.onSignal(), InterruptRelay::Action::kExit);
}

TEST(InterruptRelayTest, SignalDuringCommandCancelsIt) {
    qzb::test::TempDir dir;
    auto command = createDumpCommand(unreachableDump(dir));

    InterruptRelay relay;
    relay.attach(*command);
    EXPECT_EQ(relay.onSignal(), InterruptRelay::Action::kCancelled);
    EXPECT_EQ(command->execute(), toExitCode(ExitStatus::kInterrupted));
}

TEST(InterruptRelayTest, SignalAfterTheRunIsIgnored) {
    qzb::test::TempDir dir;
    auto command = createDumpCommand(unreachableDump(dir));

    InterruptRelay relay;
    relay.attach(*command);
    relay.detach();
    EXPECT_EQ(relay.onSignal(), InterruptRelay::Action::kIgnored);
    EXPECT_EQ(relay.onSignal(), InterruptRelay::Action::kIgnored);
}

}  // namespace qzb::commands::test

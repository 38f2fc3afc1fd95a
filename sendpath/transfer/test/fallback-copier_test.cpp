#include "sendpath/fallback-copier.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "sendpath/fake-handles.hpp"
#include "sendpath/io-handles.hpp"
#include "sendpath/temp-file.hpp"
#include "sendpath/transfer-config.hpp"
#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-state.hpp"

namespace sendpath {

using namespace std::chrono_literals;
using test::MemorySource;
using test::ScriptedDestination;

class FallbackCopierTest : public ::testing::Test {
 protected:
  TransferConfig config = TransferConfig{}.withWritableWaitTimeout(5ms);
};

TEST_F(FallbackCopierTest, SmallSourceFitsInOneBuffer) {
  FallbackCopier copier(config);
  MemorySource source("0123456789");
  ScriptedDestination destination;

  const auto result = copier.copy(source, destination, 0, 10);

  EXPECT_TRUE(result.completed);
  EXPECT_FALSE(result.usedZeroCopy);
  EXPECT_EQ(result.bytesTransferred, 10U);
  EXPECT_EQ(result.state, TransferState::Completed);
  EXPECT_EQ(source.nbReads(), 1U);
  EXPECT_EQ(destination.nbWrites(), 1U);
  EXPECT_EQ(destination.received(), "0123456789");
}

TEST_F(FallbackCopierTest, ReadsOneBufferPerCycle) {
  config.withFallbackBufferSize(16);
  FallbackCopier copier(config);
  const std::string content = test::PatternContent(100);
  MemorySource source(content);
  ScriptedDestination destination;

  const auto result = copier.copy(source, destination, 10, 80);

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(source.nbReads(), 5U);
  EXPECT_EQ(destination.nbWrites(), 5U);
  EXPECT_EQ(destination.received(), content.substr(10, 80));
}

TEST_F(FallbackCopierTest, PartialWritesAreRepeatedOnRemainder) {
  FallbackCopier copier(config);
  MemorySource source("abcdefghij");
  ScriptedDestination destination;
  destination.setDefaultStep(ScriptedDestination::Accept(3));

  const auto result = copier.copy(source, destination, 0, 10);

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(source.nbReads(), 1U);
  EXPECT_EQ(destination.nbWrites(), 4U);
  EXPECT_EQ(destination.received(), "abcdefghij");
}

TEST_F(FallbackCopierTest, WouldBlockSuspendsThenResumes) {
  FallbackCopier copier(config);
  MemorySource source("abcdefghij");
  ScriptedDestination destination;
  destination.script({ScriptedDestination::Accept(4), ScriptedDestination::WouldBlock(),
                      ScriptedDestination::Fail(EINTR)});

  const auto result = copier.copy(source, destination, 0, 10);

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(destination.waits(), (std::vector<std::chrono::milliseconds>{5ms}));
  EXPECT_EQ(destination.received(), "abcdefghij");
}

TEST_F(FallbackCopierTest, StallsWhenDestinationNeverDrains) {
  config.withIdleRetryBudget(2);
  FallbackCopier copier(config);
  MemorySource source("abcdefghij");
  ScriptedDestination destination;
  destination.script({ScriptedDestination::Accept(6)});
  destination.setDefaultStep(ScriptedDestination::WouldBlock());
  destination.scriptReadiness({Readiness::NotWritable, Readiness::NotWritable});

  const auto result = copier.copy(source, destination, 0, 10);

  EXPECT_FALSE(result.completed);
  EXPECT_EQ(result.error, TransferError::StalledTransfer);
  EXPECT_EQ(result.state, TransferState::Stalled);
  EXPECT_EQ(result.bytesTransferred, 6U);
  EXPECT_EQ(destination.waits().size(), 2U);
}

TEST_F(FallbackCopierTest, ZeroByteWritesEndWithPartialBufferFlush) {
  config.withFlushRetryBudget(3);
  FallbackCopier copier(config);
  MemorySource source("abcdefghij");
  ScriptedDestination destination;
  destination.script({ScriptedDestination::Accept(2)});
  destination.setDefaultStep(ScriptedDestination::AcceptNothing());

  const auto result = copier.copy(source, destination, 0, 10);

  EXPECT_FALSE(result.completed);
  EXPECT_EQ(result.error, TransferError::PartialBufferFlush);
  EXPECT_EQ(result.state, TransferState::Failed);
  EXPECT_EQ(result.bytesTransferred, 2U);
  EXPECT_EQ(destination.nbWrites(), 5U);
}

TEST_F(FallbackCopierTest, ZeroByteWritesLimitedByIdleBudgetToo) {
  config.withFlushRetryBudget(100).withIdleRetryBudget(1);
  FallbackCopier copier(config);
  MemorySource source("abcdefghij");
  ScriptedDestination destination;
  destination.setDefaultStep(ScriptedDestination::AcceptNothing());

  const auto result = copier.copy(source, destination, 0, 10);

  EXPECT_EQ(result.error, TransferError::PartialBufferFlush);
  EXPECT_EQ(destination.nbWrites(), 2U);
}

TEST_F(FallbackCopierTest, ReadErrorMapsToSourceUnavailable) {
  config.withFallbackBufferSize(64);
  FallbackCopier copier(config);
  MemorySource source(test::PatternContent(200));
  source.failReadsFrom(64);
  ScriptedDestination destination;

  const auto result = copier.copy(source, destination, 0, 200);

  EXPECT_FALSE(result.completed);
  EXPECT_EQ(result.error, TransferError::SourceUnavailable);
  EXPECT_EQ(result.bytesTransferred, 64U);
  EXPECT_EQ(destination.received(), test::PatternContent(64));
}

TEST_F(FallbackCopierTest, SourceEndingEarlyIsReported) {
  FallbackCopier copier(config);
  MemorySource source(test::PatternContent(100));
  source.truncateReadsAt(40);
  ScriptedDestination destination;

  const auto result = copier.copy(source, destination, 0, 100);

  EXPECT_FALSE(result.completed);
  EXPECT_EQ(result.error, TransferError::SourceUnavailable);
  EXPECT_EQ(result.bytesTransferred, 40U);
}

TEST_F(FallbackCopierTest, WriteErrorMapsToDestinationClosed) {
  FallbackCopier copier(config);
  MemorySource source(test::PatternContent(100));
  ScriptedDestination destination;
  destination.closeAfter(30);

  const auto result = copier.copy(source, destination, 0, 100);

  EXPECT_FALSE(result.completed);
  EXPECT_EQ(result.error, TransferError::DestinationClosed);
  EXPECT_EQ(result.bytesTransferred, 30U);
  EXPECT_EQ(destination.received(), test::PatternContent(30));
}

TEST_F(FallbackCopierTest, ClosedWhileWaitingMapsToDestinationClosed) {
  FallbackCopier copier(config);
  MemorySource source("abcdefghij");
  ScriptedDestination destination;
  destination.script({ScriptedDestination::WouldBlock()});
  destination.scriptReadiness({Readiness::Closed});

  const auto result = copier.copy(source, destination, 0, 10);

  EXPECT_EQ(result.error, TransferError::DestinationClosed);
  EXPECT_EQ(result.bytesTransferred, 0U);
}

TEST_F(FallbackCopierTest, BufferReturnedOnEveryExitPath) {
  FallbackCopier copier(config);
  {
    MemorySource source("abc");
    ScriptedDestination destination;
    EXPECT_TRUE(copier.copy(source, destination, 0, 3).completed);
  }
  {
    MemorySource source("abc");
    source.failReadsFrom(0);
    ScriptedDestination destination;
    EXPECT_FALSE(copier.copy(source, destination, 0, 3).completed);
  }
  {
    MemorySource source("abc");
    ScriptedDestination destination;
    destination.setDefaultStep(ScriptedDestination::Fail(ECONNRESET));
    EXPECT_FALSE(copier.copy(source, destination, 0, 3).completed);
  }
  EXPECT_EQ(copier.bufferPool().outstanding(), 0U);
  EXPECT_EQ(copier.bufferPool().idle(), 1U);
}

TEST_F(FallbackCopierTest, ZeroLengthDoesNoIo) {
  FallbackCopier copier(config);
  MemorySource source("abc");
  ScriptedDestination destination;

  const auto result = copier.copy(source, destination, 3, 0);

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(source.nbReads(), 0U);
  EXPECT_EQ(destination.nbWrites(), 0U);
}

}  // namespace sendpath

#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include "TestSupport.hpp"
#include "TransferEventBridge.hpp"
#include "TransferQueue.hpp"
#include "opens3/AuditEmitter.hpp"
#include "opens3/MockTransferEngine.hpp"

namespace opens3::test {

class TransferQueueTest : public ::testing::Test {
protected:
    void TearDown() override {
        queue_.reset();
        engine_.setEventSink(nullptr);
    }

    void makeQueue(TransferDirection dir, int maxConcurrent) {
        queue_ = std::make_unique<TransferQueue>(dir, maxConcurrent, engine_, fs_, audit_);
        bridge_.attach(dir, queue_.get());
        engine_.setEventSink(&bridge_);
        QObject::connect(queue_.get(), &TransferQueue::tasksChanged, [this]() {
            maxActive_ = std::max(maxActive_, queue_->store().countByStatus().active);
        });
        QObject::connect(queue_.get(), &TransferQueue::transferFinished, [this](const QString& id) {
            finished_.push_back(id.toStdString());
        });
    }

    std::vector<std::string> enqueue(std::vector<TransferSpec> specs) {
        std::vector<std::string> ids;
        std::string err;
        EXPECT_TRUE(queue_->enqueue(std::move(specs), ids, err)) << err;
        return ids;
    }

    TransferStatus statusOf(const std::string& id) const {
        auto t = queue_->store().find(id);
        return t ? t->status : TransferStatus::Pending;
    }

    bool waitStatus(const std::string& id, TransferStatus s) {
        return waitUntil([&]() { return statusOf(id) == s; });
    }

    bool waitHeld(const std::string& id) {
        return waitUntil([&]() { return engine_.isHeld(id); });
    }

    MockTransferEngine engine_;
    MemoryFileSystem fs_;
    RecordingHistoryLog log_;
    AuditEmitter audit_{&log_};
    TransferEventBridge bridge_;
    std::unique_ptr<TransferQueue> queue_;
    int maxActive_ = 0;
    std::vector<std::string> finished_;
};

TEST_F(TransferQueueTest, AdmitsUpToBudgetAndRefillsInOrder) {
    makeQueue(TransferDirection::Upload, 2);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2"), uploadSpec("c", "3"),
             uploadSpec("d", "4"), uploadSpec("e", "5")});

    auto c = queue_->store().countByStatus();
    EXPECT_EQ(c.active, 2);
    EXPECT_EQ(c.pending, 3);
    EXPECT_EQ(statusOf("a"), TransferStatus::Active);
    EXPECT_EQ(statusOf("b"), TransferStatus::Active);
    ASSERT_TRUE(waitHeld("a"));
    ASSERT_TRUE(waitHeld("b"));

    engine_.complete("a");
    ASSERT_TRUE(waitStatus("c", TransferStatus::Active));
    EXPECT_EQ(statusOf("a"), TransferStatus::Completed);
    EXPECT_EQ(statusOf("b"), TransferStatus::Active);
    EXPECT_EQ(statusOf("d"), TransferStatus::Pending);
    EXPECT_EQ(statusOf("e"), TransferStatus::Pending);

    for (const char* id : {"b", "c", "d", "e"}) {
        ASSERT_TRUE(waitHeld(id)) << id;
        engine_.complete(id);
    }
    ASSERT_TRUE(waitUntil([&]() { return queue_->store().countByStatus().completed == 5; }));
    EXPECT_LE(maxActive_, 2);
    EXPECT_EQ(finished_.size(), 5u);
    EXPECT_EQ(log_.records().size(), 5u);
}

TEST_F(TransferQueueTest, BudgetOneRunsStrictlyInOrder) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2"), uploadSpec("c", "3")});

    for (const char* id : {"a", "b", "c"}) {
        ASSERT_TRUE(waitHeld(id)) << id;
        EXPECT_EQ(queue_->store().countByStatus().active, 1);
        engine_.complete(id);
        ASSERT_TRUE(waitStatus(id, TransferStatus::Completed));
    }
    EXPECT_EQ(engine_.startedIds(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(maxActive_, 1);
}

TEST_F(TransferQueueTest, CancelledPendingItemIsNeverStarted) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2")});

    EXPECT_TRUE(queue_->cancelTask("b"));
    EXPECT_EQ(statusOf("b"), TransferStatus::Cancelled);
    EXPECT_FALSE(queue_->cancelTask("b"));

    ASSERT_TRUE(waitHeld("a"));
    engine_.complete("a");
    ASSERT_TRUE(waitStatus("a", TransferStatus::Completed));
    settle();
    EXPECT_EQ(engine_.startedIds(), std::vector<std::string>{"a"});
    EXPECT_EQ(statusOf("b"), TransferStatus::Cancelled);
}

TEST_F(TransferQueueTest, CancelActiveFreesSlotAndIgnoresLateCompletion) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2")});
    ASSERT_TRUE(waitHeld("a"));

    EXPECT_TRUE(queue_->cancelTask("a"));
    EXPECT_EQ(statusOf("a"), TransferStatus::Cancelled);
    EXPECT_EQ(statusOf("b"), TransferStatus::Active);
    auto cancelled = engine_.cancelledIds();
    EXPECT_NE(std::find(cancelled.begin(), cancelled.end(), "a"), cancelled.end());

    // The engine finishes anyway; the item must stay cancelled
    engine_.complete("a");
    settle();
    EXPECT_EQ(statusOf("a"), TransferStatus::Cancelled);
    EXPECT_EQ(queue_->store().countByStatus().active, 1);
    EXPECT_EQ(std::count(finished_.begin(), finished_.end(), std::string("a")), 1);
}

TEST_F(TransferQueueTest, EngineFailureDoesNotStallQueue) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2")});
    ASSERT_TRUE(waitHeld("a"));

    engine_.fail("a", "AccessDenied");
    ASSERT_TRUE(waitStatus("b", TransferStatus::Active));
    auto a = queue_->store().find("a");
    EXPECT_EQ(a->status, TransferStatus::Failed);
    EXPECT_EQ(a->error->kind, TransferErrorKind::Engine);
    EXPECT_EQ(a->error->message, "AccessDenied");
}

TEST_F(TransferQueueTest, PreflightFailureIsAuditedAndQueueContinues) {
    makeQueue(TransferDirection::Upload, 1);
    engine_.rejectWith("a", "NoSuchBucket");
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2")});

    ASSERT_TRUE(waitStatus("a", TransferStatus::Failed));
    ASSERT_TRUE(waitStatus("b", TransferStatus::Active));
    EXPECT_EQ(queue_->store().find("a")->error->kind, TransferErrorKind::Preflight);
    ASSERT_TRUE(waitUntil([&]() { return log_.records().size() == 1; }));
    EXPECT_EQ(log_.records()[0].status, TransferStatus::Failed);
    EXPECT_EQ(*log_.records()[0].errorMessage, "NoSuchBucket");
}

TEST_F(TransferQueueTest, StagingFailureMarksItemFailed) {
    makeQueue(TransferDirection::Upload, 2);
    fs_.setFailWrites(true);
    enqueue({uploadSpec("a", "1")});
    ASSERT_TRUE(waitStatus("a", TransferStatus::Failed));
    ASSERT_TRUE(waitUntil([&]() { return !finished_.empty(); }));
    EXPECT_TRUE(engine_.requests().empty());
    EXPECT_EQ(finished_, std::vector<std::string>{"a"});
}

TEST_F(TransferQueueTest, ProgressIsApplied) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1", "12345678")});
    ASSERT_TRUE(waitHeld("a"));

    engine_.progress("a", 2, 8);
    ASSERT_TRUE(waitUntil([&]() { return queue_->store().find("a")->bytesTransferred == 2; }));
    EXPECT_EQ(queue_->store().find("a")->percent(), 25);
    engine_.progress("a", 1, 8);
    settle();
    EXPECT_EQ(queue_->store().find("a")->bytesTransferred, 2u);

    engine_.complete("a");
    ASSERT_TRUE(waitStatus("a", TransferStatus::Completed));
    EXPECT_EQ(queue_->store().find("a")->percent(), 100);
}

TEST_F(TransferQueueTest, StagedPayloadIsRemovedAfterCompletion) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "dir/file.txt", "payload")});
    ASSERT_TRUE(waitHeld("a"));
    ASSERT_EQ(fs_.writes().size(), 1u);
    const std::string staged = fs_.writes().front();
    EXPECT_TRUE(fs_.exists(staged));
    EXPECT_EQ(fs_.contents(staged), bytesOf("payload"));

    // Checked at the moment the item is reported finished, not later
    int checks = 0;
    bool stagedLeft = true;
    QObject::connect(queue_.get(), &TransferQueue::transferFinished, [&](const QString&) {
        ++checks;
        stagedLeft = fs_.exists(staged);
        EXPECT_EQ(statusOf("a"), TransferStatus::Completed);
    });

    engine_.complete("a");
    ASSERT_TRUE(waitUntil([&]() { return checks == 1; }));
    EXPECT_FALSE(stagedLeft);
}

TEST_F(TransferQueueTest, OutcomeReportedDuringTransferWaitsForWorker) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "k/a.txt", "payload"), uploadSpec("b", "k/b.txt")});
    ASSERT_TRUE(waitHeld("a"));
    const std::string staged = fs_.writes().front();

    // Completed while transfer() is still running: the worker owns the staged file
    engine_.complete("a", {}, false);
    settle();
    EXPECT_EQ(statusOf("a"), TransferStatus::Active);
    EXPECT_EQ(statusOf("b"), TransferStatus::Pending);
    EXPECT_TRUE(finished_.empty());
    EXPECT_TRUE(log_.records().empty());

    engine_.release("a");
    ASSERT_TRUE(waitStatus("a", TransferStatus::Completed));
    EXPECT_FALSE(fs_.exists(staged));
    EXPECT_EQ(finished_, std::vector<std::string>{"a"});
    EXPECT_EQ(log_.records().size(), 1u);
    EXPECT_EQ(statusOf("b"), TransferStatus::Active);
}

TEST_F(TransferQueueTest, RemoveAndClearAll) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2"), uploadSpec("c", "3")});
    ASSERT_TRUE(waitHeld("a"));
    EXPECT_FALSE(queue_->removeTask("a"));

    engine_.fail("a", "boom");
    ASSERT_TRUE(waitStatus("a", TransferStatus::Failed));
    EXPECT_TRUE(queue_->removeTask("a"));
    EXPECT_FALSE(queue_->contains("a"));
    EXPECT_FALSE(queue_->removeTask("a"));

    ASSERT_TRUE(waitHeld("b"));
    EXPECT_EQ(queue_->clearAll(), 2);
    EXPECT_TRUE(queue_->store().items().empty());
    EXPECT_EQ(queue_->store().countByStatus().total(), 0);
    settle();
    EXPECT_EQ(engine_.startedIds(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(TransferQueueTest, AggregateDownloadCompletesWithoutProgress) {
    makeQueue(TransferDirection::Download, 2);
    auto spec = downloadSpec("f", "photos/2024/");
    spec.aggregate = true;
    spec.fileName = "2024.zip";
    enqueue({spec});
    ASSERT_TRUE(waitHeld("f"));
    EXPECT_TRUE(engine_.requests().front().aggregate);

    engine_.complete("f", "/downloads/2024.zip");
    ASSERT_TRUE(waitStatus("f", TransferStatus::Completed));
    auto f = queue_->store().find("f");
    EXPECT_EQ(f->percent(), 100);
    EXPECT_EQ(f->resultPath, "/downloads/2024.zip");
}

TEST_F(TransferQueueTest, EnqueueForcesQueueDirection) {
    makeQueue(TransferDirection::Download, 1);
    auto spec = downloadSpec("d", "k");
    spec.direction = TransferDirection::Upload;
    enqueue({spec});
    EXPECT_EQ(queue_->store().find("d")->spec.direction, TransferDirection::Download);
}

TEST_F(TransferQueueTest, DuplicateIdIsRejected) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1")});
    std::vector<std::string> ids;
    std::string err;
    EXPECT_FALSE(queue_->enqueue({uploadSpec("a", "2")}, ids, err));
    EXPECT_EQ(err, "Duplicate transfer id: a");
    EXPECT_EQ(queue_->store().items().size(), 1u);
}

TEST_F(TransferQueueTest, RetryRunsFailedItemAgain) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1")});
    ASSERT_TRUE(waitHeld("a"));
    engine_.fail("a", "timeout");
    ASSERT_TRUE(waitStatus("a", TransferStatus::Failed));

    std::string newId, err;
    ASSERT_TRUE(queue_->retryTask("a", newId, err)) << err;
    EXPECT_EQ(statusOf(newId), TransferStatus::Active);
    ASSERT_TRUE(waitHeld(newId));
    engine_.complete(newId);
    ASSERT_TRUE(waitStatus(newId, TransferStatus::Completed));
    EXPECT_EQ(statusOf("a"), TransferStatus::Failed);
}

TEST_F(TransferQueueTest, CancelAllStopsEverything) {
    makeQueue(TransferDirection::Upload, 1);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2"), uploadSpec("c", "3")});
    ASSERT_TRUE(waitHeld("a"));

    queue_->cancelAll();
    auto c = queue_->store().countByStatus();
    EXPECT_EQ(c.cancelled, 3);
    EXPECT_EQ(c.active, 0);
    settle();
    EXPECT_EQ(engine_.startedIds(), std::vector<std::string>{"a"});
    EXPECT_EQ(log_.records().size(), 3u);
}

TEST_F(TransferQueueTest, ClearCompletedDropsFinishedItems) {
    makeQueue(TransferDirection::Upload, 2);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2")});
    ASSERT_TRUE(waitHeld("a"));
    engine_.complete("a");
    ASSERT_TRUE(waitStatus("a", TransferStatus::Completed));

    EXPECT_EQ(queue_->clearCompleted(), 1);
    EXPECT_FALSE(queue_->contains("a"));
    EXPECT_TRUE(queue_->contains("b"));
}

TEST_F(TransferQueueTest, DestroyingQueueStopsHeldTransfers) {
    makeQueue(TransferDirection::Upload, 2);
    enqueue({uploadSpec("a", "1"), uploadSpec("b", "2")});
    ASSERT_TRUE(waitHeld("a"));
    ASSERT_TRUE(waitHeld("b"));
    queue_.reset();
    EXPECT_EQ(engine_.heldCount(), 0u);
}

} // namespace opens3::test

#include "dlqueue/download_manager.hpp"
#include "dlqueue/errors.hpp"

#include "fake_transfer_client.hpp"
#include "recording_observer.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace dlqueue {
namespace {

using fakes::FakeHandle;
using fakes::FakeTransferClient;
using fakes::RecordingObserver;

class DownloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override { manager_.setObserver(observer_); }

    DownloadRecord record(DownloadId id) const {
        const auto found = manager_.find(id);
        if (!found) {
            throw std::logic_error("record not found");
        }
        return *found;
    }

    // start() followed by metadata resolution and transfer open.
    std::shared_ptr<FakeHandle> startAndOpen(DownloadId& id, const std::string& url = "https://host/a.zip",
                                             std::optional<ResumeData> resume_data = std::nullopt) {
        id = manager_.start(url, "/downloads");
        client_->resolveNextMetadata("a.zip", "application/zip");
        return client_->openNext(std::move(resume_data));
    }

    std::shared_ptr<FakeTransferClient> client_ = std::make_shared<FakeTransferClient>();
    std::shared_ptr<RecordingObserver> observer_ = std::make_shared<RecordingObserver>();
    DownloadManager manager_{client_};
};

TEST_F(DownloadManagerTest, StartRegistersPendingRecordWithoutWaiting) {
    const auto id = manager_.start("https://host/a.zip", "/downloads");

    const auto records = manager_.list();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, id);
    EXPECT_EQ(records[0].source_url, "https://host/a.zip");
    EXPECT_EQ(records[0].destination_folder, "/downloads");
    EXPECT_TRUE(holds<Pending>(records[0].state));
    EXPECT_FALSE(records[0].filename);
    EXPECT_FALSE(records[0].transfer);
    EXPECT_EQ(client_->pendingMetadata(), 1u);
    EXPECT_EQ(client_->openRequests(), 0);
    EXPECT_TRUE(observer_->events().empty());
}

TEST_F(DownloadManagerTest, MetadataFillsRecordAndOpensTransfer) {
    const auto id = manager_.start("https://host/a.zip", "/downloads");
    client_->resolveNextMetadata("a.zip", "application/zip");

    const auto updated = record(id);
    EXPECT_EQ(updated.filename, std::optional<std::string>("a.zip"));
    EXPECT_EQ(updated.content_type, std::optional<std::string>("application/zip"));
    EXPECT_TRUE(holds<Pending>(updated.state));

    ASSERT_EQ(client_->pendingOpens(), 1u);
    const auto request = client_->peekOpen();
    EXPECT_EQ(request.url, "https://host/a.zip");
    EXPECT_EQ(request.destination_folder, "/downloads");
    EXPECT_EQ(request.filename, "a.zip");
}

TEST_F(DownloadManagerTest, OpenUsesNameFromMetadataRatherThanUrl) {
    manager_.start("https://host/get?id=7", "/downloads");
    client_->resolveNextMetadata("report.pdf", "application/pdf");

    ASSERT_EQ(client_->pendingOpens(), 1u);
    EXPECT_EQ(client_->peekOpen().filename, "report.pdf");
}

TEST_F(DownloadManagerTest, OpenedTransferStartsDownloading) {
    DownloadId id;
    const auto handle = startAndOpen(id);

    const auto started = record(id);
    ASSERT_TRUE(holds<Downloading>(started.state));
    EXPECT_DOUBLE_EQ(std::get<Downloading>(started.state).progress, 0.0);
    EXPECT_EQ(started.transfer, handle);
    EXPECT_TRUE(started.started_at);
    EXPECT_FALSE(started.ended_at);

    ASSERT_EQ(observer_->kinds(), std::vector<std::string>{"started"});
    EXPECT_EQ(observer_->last().record.id, id);
    EXPECT_EQ(observer_->last().index, 0u);
}

TEST_F(DownloadManagerTest, ProgressUpdatesStateAndNotifies) {
    DownloadId id;
    const auto handle = startAndOpen(id);

    handle->emitProgress(0.25);
    handle->emitProgress(0.5);

    const auto current = record(id);
    ASSERT_TRUE(holds<Downloading>(current.state));
    EXPECT_DOUBLE_EQ(std::get<Downloading>(current.state).progress, 0.5);
    EXPECT_EQ(observer_->count("progress"), 2u);
}

TEST_F(DownloadManagerTest, PauseSuspendsTransferAndKeepsHandle) {
    DownloadId id;
    const auto handle = startAndOpen(id);
    handle->emitProgress(0.4);

    manager_.pause(id);

    const auto paused = record(id);
    ASSERT_TRUE(holds<Paused>(paused.state));
    EXPECT_DOUBLE_EQ(std::get<Paused>(paused.state).progress, 0.4);
    EXPECT_EQ(paused.transfer, handle);
    EXPECT_TRUE(handle->isSuspended());
    EXPECT_EQ(observer_->last().kind, "paused");

    manager_.pause(id);
    EXPECT_EQ(handle->suspendCalls(), 1);
    EXPECT_EQ(observer_->count("paused"), 1u);
}

TEST_F(DownloadManagerTest, ProgressWhilePausedIsDiscarded) {
    DownloadId id;
    const auto handle = startAndOpen(id);
    handle->emitProgress(0.4);
    manager_.pause(id);

    handle->emitProgress(0.5);

    const auto paused = record(id);
    ASSERT_TRUE(holds<Paused>(paused.state));
    EXPECT_DOUBLE_EQ(std::get<Paused>(paused.state).progress, 0.4);
    EXPECT_EQ(observer_->count("progress"), 1u);
}

TEST_F(DownloadManagerTest, PauseResumeCompleteScenario) {
    const auto id = manager_.start("https://example.com/A", "/D");
    client_->resolveNextMetadata("a.zip", "application/zip");
    const auto handle = client_->openNext();

    handle->emitProgress(0.4);
    manager_.pause(id);
    handle->emitProgress(0.5);

    auto paused = record(id);
    ASSERT_TRUE(holds<Paused>(paused.state));
    EXPECT_DOUBLE_EQ(*progressOf(paused.state), 0.4);
    EXPECT_FALSE(paused.temporary_progress);

    manager_.resume(id);
    EXPECT_FALSE(handle->isSuspended());
    EXPECT_EQ(handle->resumeCalls(), 1);
    auto resumed = record(id);
    ASSERT_TRUE(holds<Downloading>(resumed.state));
    EXPECT_DOUBLE_EQ(std::get<Downloading>(resumed.state).progress, 0.4);

    handle->succeed();

    const auto done = record(id);
    EXPECT_TRUE(holds<Completed>(done.state));
    EXPECT_FALSE(done.transfer);
    EXPECT_TRUE(done.ended_at);
    EXPECT_EQ(done.filename, std::optional<std::string>("a.zip"));
    EXPECT_EQ(manager_.list().size(), 1u);
    EXPECT_EQ(observer_->count("success"), 1u);
    EXPECT_EQ(observer_->kinds(),
              (std::vector<std::string>{"started", "progress", "paused", "resumed", "success"}));

    handle->succeed();
    EXPECT_EQ(observer_->count("success"), 1u);
}

TEST_F(DownloadManagerTest, TransferFailureIsRecordedOnce) {
    DownloadId id;
    const auto handle = startAndOpen(id);
    handle->emitProgress(0.3);

    handle->fail("The network connection was lost.");

    const auto failed = record(id);
    ASSERT_TRUE(holds<Failed>(failed.state));
    EXPECT_EQ(std::get<Failed>(failed.state).reason, "The network connection was lost.");
    EXPECT_TRUE(failed.ended_at);
    EXPECT_FALSE(failed.transfer);
    EXPECT_EQ(observer_->count("error"), 1u);

    handle->emitProgress(0.6);
    handle->fail("again");
    EXPECT_EQ(std::get<Failed>(record(id).state).reason, "The network connection was lost.");
    EXPECT_EQ(observer_->count("error"), 1u);
    EXPECT_EQ(observer_->count("progress"), 1u);
}

TEST_F(DownloadManagerTest, MetadataFailureFailsWithoutOpening) {
    const auto id = manager_.start("https://host/missing", "/downloads");
    client_->failNextMetadata("could not resolve host");

    const auto failed = record(id);
    ASSERT_TRUE(holds<Failed>(failed.state));
    EXPECT_EQ(std::get<Failed>(failed.state).reason, "metadata resolution failed: could not resolve host");
    EXPECT_EQ(client_->openRequests(), 0);
    EXPECT_EQ(observer_->kinds(), std::vector<std::string>{"error"});
}

TEST_F(DownloadManagerTest, OpenFailureFailsRecord) {
    const auto id = manager_.start("https://host/a.zip", "/readonly");
    client_->resolveNextMetadata("a.zip", "");
    client_->failNextOpen("permission denied");

    const auto failed = record(id);
    ASSERT_TRUE(holds<Failed>(failed.state));
    EXPECT_EQ(std::get<Failed>(failed.state).reason, "transfer open failed: permission denied");
    EXPECT_FALSE(failed.content_type);
    EXPECT_EQ(observer_->count("error"), 1u);
}

TEST_F(DownloadManagerTest, FailedTransferLeavesOtherRecordsAlone) {
    DownloadId first;
    const auto first_handle = startAndOpen(first, "https://host/one");
    DownloadId second;
    const auto second_handle = startAndOpen(second, "https://host/two");
    second_handle->emitProgress(0.7);

    first_handle->fail("timed out");

    EXPECT_TRUE(holds<Failed>(record(first).state));
    const auto other = record(second);
    ASSERT_TRUE(holds<Downloading>(other.state));
    EXPECT_DOUBLE_EQ(std::get<Downloading>(other.state).progress, 0.7);
}

TEST_F(DownloadManagerTest, RemoveBeforeMetadataSkipsTransfer) {
    const auto id = manager_.start("https://host/a.zip", "/downloads");
    manager_.remove(id);

    client_->resolveNextMetadata("a.zip", "application/zip");

    EXPECT_TRUE(manager_.list().empty());
    EXPECT_EQ(client_->openRequests(), 0);
    EXPECT_EQ(observer_->kinds(), std::vector<std::string>{"removed"});
}

TEST_F(DownloadManagerTest, RemoveBeforeOpenCancelsLateHandle) {
    const auto id = manager_.start("https://host/a.zip", "/downloads");
    client_->resolveNextMetadata("a.zip", "application/zip");
    manager_.remove(id);

    const auto handle = client_->openNext();

    EXPECT_TRUE(handle->cancelled());
    EXPECT_TRUE(manager_.list().empty());
    EXPECT_EQ(observer_->kinds(), std::vector<std::string>{"removed"});
}

TEST_F(DownloadManagerTest, CallbacksAfterRemoveAreIgnored) {
    DownloadId id;
    const auto handle = startAndOpen(id);

    manager_.remove(id);
    EXPECT_TRUE(handle->cancelled());
    const auto removed = observer_->last();
    EXPECT_EQ(removed.kind, "removed");
    EXPECT_EQ(removed.record.id, id);
    EXPECT_FALSE(removed.record.transfer);

    handle->emitProgress(0.9);
    handle->fail("cancelled");
    handle->succeed();

    EXPECT_TRUE(manager_.list().empty());
    EXPECT_FALSE(manager_.find(id));
    EXPECT_EQ(observer_->kinds(), (std::vector<std::string>{"started", "removed"}));
}

TEST_F(DownloadManagerTest, RemoveReportsFormerIndex) {
    DownloadId first;
    startAndOpen(first, "https://host/one");
    DownloadId second;
    const auto second_handle = startAndOpen(second, "https://host/two");

    manager_.remove(second);
    EXPECT_EQ(observer_->last().index, 1u);

    DownloadId third;
    const auto third_handle = startAndOpen(third, "https://host/three");
    manager_.remove(first);
    third_handle->emitProgress(0.1);

    EXPECT_EQ(observer_->last().kind, "progress");
    EXPECT_EQ(observer_->last().index, 0u);
}

TEST_F(DownloadManagerTest, CancelIsSynchronousAndTerminal) {
    DownloadId id;
    const auto handle = startAndOpen(id);
    handle->emitProgress(0.2);

    manager_.cancel(id);

    const auto cancelled = record(id);
    EXPECT_TRUE(holds<Cancelled>(cancelled.state));
    EXPECT_TRUE(cancelled.ended_at);
    EXPECT_FALSE(cancelled.transfer);
    EXPECT_TRUE(handle->cancelled());
    EXPECT_EQ(observer_->last().kind, "cancelled");

    // The transport reports its own cancellation afterwards.
    handle->fail("cancelled");
    handle->emitProgress(0.3);
    manager_.cancel(id);

    EXPECT_TRUE(holds<Cancelled>(record(id).state));
    EXPECT_EQ(observer_->count("error"), 0u);
    EXPECT_EQ(observer_->count("cancelled"), 1u);
}

TEST_F(DownloadManagerTest, CancelWhilePendingDiscardsLateTransfer) {
    const auto id = manager_.start("https://host/a.zip", "/downloads");
    client_->resolveNextMetadata("a.zip", "application/zip");
    manager_.cancel(id);

    const auto handle = client_->openNext();

    EXPECT_TRUE(handle->cancelled());
    EXPECT_TRUE(holds<Cancelled>(record(id).state));
    EXPECT_EQ(observer_->kinds(), std::vector<std::string>{"cancelled"});
}

TEST_F(DownloadManagerTest, CancelBeforeMetadataSkipsTransfer) {
    const auto id = manager_.start("https://host/a.zip", "/downloads");
    manager_.cancel(id);
    client_->resolveNextMetadata("a.zip", "application/zip");

    EXPECT_EQ(client_->openRequests(), 0);
    EXPECT_TRUE(holds<Cancelled>(record(id).state));
}

TEST_F(DownloadManagerTest, CompletedRecordCannotBeCancelledOrPaused) {
    DownloadId id;
    const auto handle = startAndOpen(id);
    handle->succeed();

    manager_.cancel(id);
    manager_.pause(id);
    manager_.resume(id);

    EXPECT_TRUE(holds<Completed>(record(id).state));
    EXPECT_EQ(observer_->kinds(), (std::vector<std::string>{"started", "success"}));
}

TEST_F(DownloadManagerTest, PauseIgnoredBeforeTransferStarts) {
    const auto id = manager_.start("https://host/a.zip", "/downloads");
    manager_.pause(id);

    EXPECT_TRUE(holds<Pending>(record(id).state));
    EXPECT_TRUE(observer_->events().empty());
}

TEST_F(DownloadManagerTest, ResumeIgnoredUnlessPaused) {
    DownloadId id;
    const auto handle = startAndOpen(id);

    EXPECT_NO_THROW(manager_.resume(id));

    EXPECT_EQ(handle->resumeCalls(), 0);
    EXPECT_EQ(observer_->count("resumed"), 0u);
}

TEST_F(DownloadManagerTest, CommandsOnUnknownIdAreNoOps) {
    const DownloadId unknown{987654321};

    EXPECT_NO_THROW(manager_.pause(unknown));
    EXPECT_NO_THROW(manager_.resume(unknown));
    EXPECT_NO_THROW(manager_.cancel(unknown));
    EXPECT_NO_THROW(manager_.remove(unknown));
    EXPECT_NO_THROW(manager_.releaseTransfer(unknown));
    EXPECT_TRUE(observer_->events().empty());
}

TEST_F(DownloadManagerTest, ResumeWithoutTransferOrStateIsImpossible) {
    DownloadId id;
    const auto handle = startAndOpen(id);
    handle->emitProgress(0.4);
    manager_.pause(id);
    manager_.releaseTransfer(id);

    const auto before = record(id);
    ASSERT_TRUE(holds<Paused>(before.state));
    EXPECT_FALSE(before.transfer);
    EXPECT_FALSE(before.resume_state);

    try {
        manager_.resume(id);
        FAIL() << "resume should have thrown";
    } catch (const DownloadError& error) {
        EXPECT_EQ(error.code(), ErrorCode::ResumeImpossible);
    }

    const auto after = record(id);
    ASSERT_TRUE(holds<Paused>(after.state));
    EXPECT_DOUBLE_EQ(std::get<Paused>(after.state).progress, 0.4);
    EXPECT_EQ(client_->resumeRequests(), 0);
    EXPECT_EQ(observer_->count("resumed"), 0u);
}

TEST_F(DownloadManagerTest, ReleasedTransferResumesFromSavedState) {
    const ResumeData saved{1, 2, 3, 4};
    DownloadId id;
    const auto old_handle = startAndOpen(id, "https://host/a.zip", saved);
    old_handle->emitProgress(0.4);
    manager_.pause(id);

    manager_.releaseTransfer(id);

    auto released = record(id);
    EXPECT_TRUE(old_handle->cancelled());
    EXPECT_FALSE(released.transfer);
    ASSERT_TRUE(released.resume_state);
    EXPECT_EQ(*released.resume_state, saved);
    EXPECT_TRUE(holds<Paused>(released.state));

    manager_.resume(id);

    EXPECT_EQ(client_->resumeRequests(), 1);
    const auto request = client_->peekOpen();
    ASSERT_TRUE(request.resume_data);
    EXPECT_EQ(*request.resume_data, saved);
    EXPECT_EQ(request.destination_folder, "/downloads");
    auto reopening = record(id);
    EXPECT_FALSE(reopening.resume_state);
    EXPECT_TRUE(reopening.reopening);
    EXPECT_TRUE(holds<Paused>(reopening.state));

    // A second resume while the re-open is in flight does nothing.
    EXPECT_NO_THROW(manager_.resume(id));
    EXPECT_EQ(client_->resumeRequests(), 1);

    const auto new_handle = client_->openNext();
    auto resumed = record(id);
    ASSERT_TRUE(holds<Downloading>(resumed.state));
    EXPECT_DOUBLE_EQ(std::get<Downloading>(resumed.state).progress, 0.4);
    EXPECT_EQ(resumed.temporary_progress, std::optional<double>(0.4));
    EXPECT_EQ(resumed.transfer, new_handle);
    EXPECT_FALSE(resumed.reopening);
    EXPECT_EQ(observer_->last().kind, "resumed");

    // The old transfer's cancellation must not touch the resumed one.
    old_handle->fail("cancelled");
    EXPECT_TRUE(holds<Downloading>(record(id).state));

    new_handle->emitProgress(0.55);
    resumed = record(id);
    EXPECT_DOUBLE_EQ(std::get<Downloading>(resumed.state).progress, 0.55);
    EXPECT_FALSE(resumed.temporary_progress);

    new_handle->succeed();
    EXPECT_TRUE(holds<Completed>(record(id).state));
    EXPECT_EQ(manager_.list().size(), 1u);
}

TEST_F(DownloadManagerTest, RestoredRecordResumesThroughClient) {
    const ResumeData saved{9, 8, 7};
    const auto id = manager_.restore("https://host/big.iso", "/downloads", saved, 0.75);

    auto restored = record(id);
    ASSERT_TRUE(holds<Paused>(restored.state));
    EXPECT_DOUBLE_EQ(std::get<Paused>(restored.state).progress, 0.75);
    EXPECT_EQ(restored.temporary_progress, std::optional<double>(0.75));
    EXPECT_FALSE(restored.transfer);
    EXPECT_FALSE(restored.started_at);

    manager_.resume(id);
    const auto handle = client_->openNext();

    const auto resumed = record(id);
    ASSERT_TRUE(holds<Downloading>(resumed.state));
    EXPECT_DOUBLE_EQ(std::get<Downloading>(resumed.state).progress, 0.75);
    EXPECT_TRUE(resumed.started_at);
    EXPECT_EQ(observer_->kinds(), std::vector<std::string>{"resumed"});

    handle->succeed();
    EXPECT_TRUE(holds<Completed>(record(id).state));
}

TEST_F(DownloadManagerTest, ResumeOpenFailureFailsRecord) {
    const auto id = manager_.restore("https://host/big.iso", "/downloads", ResumeData{1}, 0.5);
    manager_.resume(id);

    client_->failNextOpen("server rejected range");

    const auto failed = record(id);
    ASSERT_TRUE(holds<Failed>(failed.state));
    EXPECT_EQ(std::get<Failed>(failed.state).reason, "transfer open failed: server rejected range");
    EXPECT_FALSE(failed.reopening);
    EXPECT_EQ(observer_->count("error"), 1u);
}

TEST_F(DownloadManagerTest, CancelDuringReopenDiscardsNewTransfer) {
    const auto id = manager_.restore("https://host/big.iso", "/downloads", ResumeData{1}, 0.5);
    manager_.resume(id);
    manager_.cancel(id);

    const auto handle = client_->openNext();

    EXPECT_TRUE(handle->cancelled());
    EXPECT_TRUE(holds<Cancelled>(record(id).state));
    EXPECT_EQ(observer_->kinds(), std::vector<std::string>{"cancelled"});
}

TEST_F(DownloadManagerTest, IdsAreNeverShared) {
    std::unordered_set<DownloadId> seen;
    std::vector<DownloadId> live;
    for (int round = 0; round < 20; ++round) {
        const auto id = manager_.start("https://host/file", "/downloads");
        EXPECT_TRUE(seen.insert(id).second);
        live.push_back(id);
        if (round % 3 == 0) {
            manager_.remove(live.front());
            live.erase(live.begin());
        }
    }
    const auto restored = manager_.restore("https://host/file", "/downloads", ResumeData{1});
    EXPECT_TRUE(seen.insert(restored).second);

    EXPECT_EQ(manager_.list().size(), live.size() + 1);
}

TEST_F(DownloadManagerTest, IdAtResolvesCurrentPosition) {
    const auto first = manager_.start("https://host/one", "/downloads");
    const auto second = manager_.start("https://host/two", "/downloads");

    EXPECT_EQ(manager_.idAt(1), std::optional<DownloadId>(second));
    manager_.remove(first);
    EXPECT_EQ(manager_.idAt(0), std::optional<DownloadId>(second));
    EXPECT_FALSE(manager_.idAt(1));
}

TEST_F(DownloadManagerTest, ExpiredObserverIsNotAnError) {
    DownloadId id;
    const auto handle = startAndOpen(id);
    const auto events_before = observer_->events().size();
    observer_.reset();

    handle->emitProgress(0.5);
    manager_.pause(id);
    manager_.resume(id);
    handle->succeed();

    EXPECT_TRUE(holds<Completed>(record(id).state));
    EXPECT_EQ(events_before, 1u);
}

class ThrowingObserver final : public RecordingObserver {
protected:
    void add(const std::string& kind, const DownloadRecord& record, std::size_t index) override {
        RecordingObserver::add(kind, record, index);
        throw std::runtime_error("observer failure");
    }
};

TEST_F(DownloadManagerTest, ObserverExceptionsDoNotEscape) {
    auto throwing = std::make_shared<ThrowingObserver>();
    manager_.setObserver(throwing);

    DownloadId id;
    std::shared_ptr<FakeHandle> handle;
    ASSERT_NO_THROW(handle = startAndOpen(id));
    ASSERT_NO_THROW(handle->emitProgress(0.5));
    ASSERT_NO_THROW(handle->succeed());

    EXPECT_TRUE(holds<Completed>(record(id).state));
    EXPECT_EQ(throwing->kinds(), (std::vector<std::string>{"started", "progress", "success"}));
}

TEST(DownloadManagerLifetimeTest, CallbacksAfterManagerIsGoneAreDropped) {
    auto client = std::make_shared<FakeTransferClient>();
    auto manager = std::make_unique<DownloadManager>(client);
    manager->start("https://host/a.zip", "/downloads");
    manager.reset();

    EXPECT_NO_THROW(client->resolveNextMetadata("a.zip", "application/zip"));
    EXPECT_EQ(client->openRequests(), 0);
}

TEST(DownloadManagerLifetimeTest, RequiresTransferClient) {
    EXPECT_THROW(DownloadManager(nullptr), std::invalid_argument);
}

} // namespace
} // namespace dlqueue

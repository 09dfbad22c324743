#include <gtest/gtest.h>

#include <algorithm>

#include "TestSupport.hpp"
#include "core/importer/ArchiveImporter.hpp"
#include "core/importer/MediaFilter.hpp"

using namespace takeout;
using takeout::core::CancellationToken;
using takeout::core::ErrorKind;
using takeout::core::TransferError;
using takeout::core::TransferOutcome;
using takeout::core::importer::ArchiveImporter;
using takeout::core::importer::MediaFilter;
using takeout::core::state::CheckpointStore;
using takeout::core::transfer::CallbackProgressSink;
using takeout::core::transfer::ProgressEvent;
using takeout::test::FakeIngestClient;
using takeout::test::TempDir;

class ArchiveImporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<CheckpointStore>(dir / "state.json");
        job = Job::create();
        job.status = JobStatus::Uploading;
    }

    /**
     * Register a downloaded archive on the job
     */
    std::string addArchive(const std::string& name, const test::ZipEntries& entries) {
        auto path = dir / name;
        test::writeZip(path, entries);
        job.addFile("id-" + name, name, static_cast<int64_t>(std::filesystem::file_size(path)));
        auto& file = job.files.back();
        file.downloaded = true;
        file.localPath = path.string();
        file.bytesTransferred = file.expectedSize;
        return file.localPath;
    }

    TransferOutcome runImport(ArchiveImporter& importer) {
        return importer.importAll(cancel, job, sink);
    }

    TempDir dir;
    std::unique_ptr<CheckpointStore> store;
    FakeIngestClient ingest;
    CancellationToken cancel;
    std::vector<ProgressEvent> events;
    CallbackProgressSink sink{[this](const ProgressEvent& e) { events.push_back(e); }};
    Job job;
};

TEST(MediaFilterTest, ClassifiesByExtension) {
    EXPECT_TRUE(MediaFilter::isMedia("Takeout/Google Photos/2019/IMG_0001.JPG"));
    EXPECT_TRUE(MediaFilter::isMedia("clip.mp4"));
    EXPECT_TRUE(MediaFilter::isMedia("raw/DSC_0001.nef"));
    EXPECT_TRUE(MediaFilter::isMedia("x.heic"));
    EXPECT_FALSE(MediaFilter::isMedia("IMG_0001.jpg.json"));
    EXPECT_FALSE(MediaFilter::isMedia("archive_browser.html"));
    EXPECT_FALSE(MediaFilter::isMedia("Takeout/Google Photos/"));
    EXPECT_FALSE(MediaFilter::isMedia("README"));

    EXPECT_TRUE(MediaFilter::isArchive("/tmp/takeout-001.ZIP"));
    EXPECT_FALSE(MediaFilter::isArchive("/tmp/takeout-001.tgz"));
}

TEST_F(ArchiveImporterTest, CountsOnlyMediaEntries) {
    auto archive = addArchive("takeout-001.zip", test::takeoutEntries(20, 5));
    ArchiveImporter importer(ingest, *store);

    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);

    ASSERT_TRUE(job.uploadProgress.has_value());
    EXPECT_EQ(job.uploadProgress->totalEntries(), 20);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 20);
    EXPECT_EQ(job.uploadProgress->completedKeys().size(), 20u);
    EXPECT_TRUE(job.uploadProgress->isFinished(archive));
    EXPECT_EQ(ingest.callCount, 20);
    for (const auto& name : ingest.uploadedNames) {
        EXPECT_EQ(name.find('/'), std::string::npos);
        EXPECT_TRUE(MediaFilter::isMedia(name));
    }
    EXPECT_EQ(events.size(), 20u);
    EXPECT_EQ(events.back().completedCount, 20);
    EXPECT_EQ(events.back().totalCount, 20);
}

TEST_F(ArchiveImporterTest, RerunOnCompletedJobUploadsNothing) {
    addArchive("takeout-001.zip", test::takeoutEntries(10, 2));
    ArchiveImporter importer(ingest, *store);
    runImport(importer);
    ASSERT_EQ(ingest.callCount, 10);

    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);
    EXPECT_EQ(ingest.callCount, 10);
    EXPECT_EQ(job.uploadProgress->totalEntries(), 10);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 10);
}

TEST_F(ArchiveImporterTest, ExternalIdIsDerivedFromContent) {
    addArchive("takeout-001.zip", {{"Takeout/abc.jpg", "abc"}});
    ArchiveImporter importer(ingest, *store);
    runImport(importer);

    EXPECT_EQ(ingest.lastUpload.filename, "abc.jpg");
    EXPECT_EQ(ingest.lastUpload.externalId, "import-a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(std::string(ingest.lastContent.begin(), ingest.lastContent.end()), "abc");
}

TEST_F(ArchiveImporterTest, DuplicatesCountAsCompleted) {
    addArchive("takeout-001.zip", test::takeoutEntries(5, 0));
    // Same content in a second archive is reported as already present
    addArchive("takeout-002.zip", test::takeoutEntries(5, 0));

    ArchiveImporter importer(ingest, *store);
    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);

    EXPECT_EQ(ingest.createdCount, 5);
    EXPECT_EQ(ingest.duplicateCount, 5);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 10);
    EXPECT_EQ(job.uploadProgress->totalEntries(), 10);
    EXPECT_EQ(importer.stats().duplicates, 5);
}

TEST_F(ArchiveImporterTest, EntryFailureDoesNotStopArchive) {
    auto archive = addArchive("takeout-001.zip", test::takeoutEntries(20, 0));
    ingest.failingNames.insert("IMG_1003.jpg");

    ArchiveImporter importer(ingest, *store);
    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);

    EXPECT_EQ(ingest.callCount, 20);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 19);
    EXPECT_EQ(importer.stats().failed, 1);
    EXPECT_FALSE(job.uploadProgress->isFinished(archive));

    // The next run retries only the failed entry, without recounting the archive
    ingest.failingNames.clear();
    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);
    EXPECT_EQ(ingest.callCount, 21);
    EXPECT_EQ(ingest.uploadedNames.back(), "IMG_1003.jpg");
    EXPECT_EQ(job.uploadProgress->completedEntries(), 20);
    EXPECT_EQ(job.uploadProgress->totalEntries(), 20);
    EXPECT_TRUE(job.uploadProgress->isFinished(archive));
}

TEST_F(ArchiveImporterTest, OversizedEntryIsIsolated) {
    auto entries = test::takeoutEntries(6, 0);
    entries.emplace_back("Takeout/Google Photos/Album/VID_0001.mp4", std::string(4096, 'v'));
    auto archive = addArchive("takeout-001.zip", entries);

    ArchiveImporter importer(ingest, *store);
    importer.setMaxEntrySize(1024);
    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);

    EXPECT_EQ(ingest.callCount, 6);
    EXPECT_EQ(std::count(ingest.uploadedNames.begin(), ingest.uploadedNames.end(), "VID_0001.mp4"), 0);
    EXPECT_EQ(importer.stats().failed, 1);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 6);
    EXPECT_EQ(job.uploadProgress->totalEntries(), 7);
    EXPECT_FALSE(job.uploadProgress->isFinished(archive));

    // The ledger on disk matches memory
    auto persisted = store->load();
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->uploadProgress->completedEntries(), 6);
}

TEST_F(ArchiveImporterTest, CancellationKeepsLedgerConsistent) {
    addArchive("takeout-001.zip", test::takeoutEntries(20, 3));
    ingest.cancelToken = cancel;
    ingest.cancelAfterCalls = 7;

    ArchiveImporter importer(ingest, *store);
    EXPECT_EQ(runImport(importer), TransferOutcome::Cancelled);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 7);
    EXPECT_EQ(job.uploadProgress->totalEntries(), 20);

    cancel.reset();
    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);
    EXPECT_EQ(ingest.callCount, 20);
    EXPECT_EQ(ingest.duplicateCount, 0);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 20);
    EXPECT_EQ(job.uploadProgress->totalEntries(), 20);
}

TEST_F(ArchiveImporterTest, CheckpointsAtConfiguredCadence) {
    addArchive("takeout-001.zip", test::takeoutEntries(20, 0));
    ArchiveImporter importer(ingest, *store);
    importer.setCheckpointInterval(5);

    runImport(importer);
    // Four cadence saves plus one at the end of the archive
    EXPECT_EQ(store->saveCount(), 5u);
}

TEST_F(ArchiveImporterTest, CrashAfterCheckpointReuploadsOnlyUnrecordedEntries) {
    addArchive("takeout-001.zip", test::takeoutEntries(30, 0));
    ingest.cancelToken = cancel;
    ingest.cancelAfterCalls = 17;

    ArchiveImporter importer(ingest, *store);
    importer.setCheckpointInterval(10);
    ASSERT_EQ(runImport(importer), TransferOutcome::Cancelled);

    // Simulate a crash: the in-memory ledger is lost, the record holds the checkpoint at 10
    auto restored = store->load();
    ASSERT_TRUE(restored.has_value());
    ASSERT_EQ(restored->uploadProgress->completedEntries(), 10);
    job = *restored;

    cancel.reset();
    ArchiveImporter restarted(ingest, *store);
    EXPECT_EQ(runImport(restarted), TransferOutcome::Completed);

    // Entries 11-17 reached the server before the crash and come back as duplicates
    EXPECT_EQ(restarted.stats().duplicates, 7);
    EXPECT_EQ(restarted.stats().uploaded, 13);
    EXPECT_EQ(job.uploadProgress->completedEntries(), 30);
    EXPECT_EQ(job.uploadProgress->completedKeys().size(), 30u);
    EXPECT_EQ(job.uploadProgress->totalEntries(), 30);
}

TEST_F(ArchiveImporterTest, SkipsNonArchivesAndPendingDownloads) {
    addArchive("takeout-001.zip", test::takeoutEntries(3, 0));

    job.addFile("id-notes", "notes.txt", 10);
    job.files.back().downloaded = true;
    job.files.back().localPath = (dir / "notes.txt").string();

    job.addFile("id-pending", "takeout-002.zip", 1000);

    ArchiveImporter importer(ingest, *store);
    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);
    EXPECT_EQ(ingest.callCount, 3);
    EXPECT_EQ(job.uploadProgress->countedArchives().size(), 1u);
}

TEST_F(ArchiveImporterTest, UnreadableArchiveIsFatal) {
    auto path = dir / "takeout-bad.zip";
    test::writeAll(path, "this is not a zip file");
    job.addFile("id-bad", "takeout-bad.zip", 22);
    job.files.back().downloaded = true;
    job.files.back().localPath = path.string();

    ArchiveImporter importer(ingest, *store);
    try {
        runImport(importer);
        FAIL() << "expected the archive to be rejected";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransientIO);
    }
    EXPECT_EQ(ingest.callCount, 0);
}

TEST_F(ArchiveImporterTest, FinishedArchiveIsNotReopened) {
    auto archive = addArchive("takeout-001.zip", test::takeoutEntries(4, 0));
    ArchiveImporter importer(ingest, *store);
    runImport(importer);
    ASSERT_TRUE(job.uploadProgress->isFinished(archive));

    // Losing the local file after completion does not matter any more
    std::filesystem::remove(archive);
    EXPECT_EQ(runImport(importer), TransferOutcome::Completed);
    EXPECT_EQ(ingest.callCount, 4);
}

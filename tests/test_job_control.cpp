#include <gtest/gtest.h>
#include <managers/job_control.hpp>
#include <managers/job_log.hpp>
#include <managers/yaml_job_store.hpp>
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// Operator actions without a worker in the process: every change lands in
// the store for a separate `serve` to pick up.
class JobControlTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FilesLayout layout;
    std::unique_ptr<YamlJobStore> store;
    std::unique_ptr<JobControl> control;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("chartreader_control_test_" + generate_id(8));
        layout.root = test_dir;
        ensure_directory_structure(layout);
        set_log_dir(layout.logs_dir());
        store = std::make_unique<YamlJobStore>(layout.state_dir(), WorkerSettings{});
        control = std::make_unique<JobControl>(*store, layout);
    }

    void TearDown() override {
        control.reset();
        store.reset();
        fs::remove_all(test_dir);
    }

    void drop_file(const std::string& name) {
        std::ofstream(layout.new_dir() / name) << "bytes";
    }

    Job register_file(const std::string& name) {
        drop_file(name);
        auto r = control->register_upload(name, name);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }

    void set_status(const std::string& id, JobStatus status) {
        store->update_job(id, [status](Job& j) {
            j.status = status;
            return true;
        });
    }
};

// ── Intake ──────────────────────────────────────────────────

TEST_F(JobControlTest, RegisterQueuesDatedFile) {
    Job job = register_file("1979-03-10_disco.png");
    EXPECT_EQ(job.status, JobStatus::Queued);
    EXPECT_EQ(job.canonical_filename, "1979-03-10_disco.png");
    EXPECT_EQ(job.entry_date, std::optional<std::string>("1979-03-10"));
    EXPECT_EQ(job.version_count, 1);
    EXPECT_EQ(job.file_location, FileLocation::New);
    EXPECT_EQ(store->list_jobs().size(), 1u);
}

TEST_F(JobControlTest, RegisterWithoutDateIsErrorJob) {
    Job job = register_file("disco_chart.png");
    EXPECT_EQ(job.status, JobStatus::Error);
    EXPECT_EQ(job.error, "Date not found in filename (expected YYYY-MM-DD)");
    EXPECT_FALSE(job.entry_date.has_value());
}

TEST_F(JobControlTest, RegisterRejectsUnsupportedType) {
    drop_file("1979-03-10_notes.txt");
    auto r = control->register_upload("1979-03-10_notes.txt", "1979-03-10_notes.txt");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Unsupported file type"), std::string::npos);
    EXPECT_TRUE(store->list_jobs().empty());
}

TEST_F(JobControlTest, ReuploadBecomesNewVersion) {
    Job first = register_file("1979-03-10_disco.png");
    set_status(first.id, JobStatus::Completed);

    drop_file("1979-03-10_disco_1.png");
    auto r = control->register_upload("1979-03-10_disco_1.png", "1979-03-10_disco.png");
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(r.value.id, first.id);
    EXPECT_EQ(r.value.status, JobStatus::Queued);
    EXPECT_EQ(r.value.filename, "1979-03-10_disco_1.png");
    EXPECT_EQ(r.value.version_count, 2);
    EXPECT_FALSE(r.value.pending_filename.has_value());
    EXPECT_EQ(store->list_jobs().size(), 1u);
}

TEST_F(JobControlTest, ReuploadWhileProcessingIsHeldPending) {
    Job first = register_file("1979-03-10_disco.png");
    set_status(first.id, JobStatus::Processing);

    drop_file("1979-03-10_disco_1.png");
    auto r = control->register_upload("1979-03-10_disco_1.png", "1979-03-10_disco.png");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.status, JobStatus::Processing);
    EXPECT_EQ(r.value.filename, "1979-03-10_disco.png");
    EXPECT_EQ(r.value.pending_filename, std::optional<std::string>("1979-03-10_disco_1.png"));
}

TEST_F(JobControlTest, ReuploadAfterDeleteStartsNewJob) {
    Job first = register_file("1979-03-10_disco.png");
    ASSERT_TRUE(control->delete_job(first.id).is_ok());

    Job second = register_file("1979-03-10_disco.png");
    EXPECT_NE(second.id, first.id);
    EXPECT_EQ(second.version_count, 1);
    EXPECT_EQ(store->list_jobs().size(), 2u);
}

TEST_F(JobControlTest, ImportCopiesUnderFreeName) {
    fs::path outside = test_dir / "incoming";
    fs::create_directories(outside);
    std::ofstream(outside / "1979-03-10 disco.png") << "bytes";
    drop_file("1979-03-10_disco.png");   // stray file already occupies the name

    auto r = control->import_file(outside / "1979-03-10 disco.png");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.filename, "1979-03-10_disco_1.png");
    EXPECT_EQ(r.value.canonical_filename, "1979-03-10_disco.png");
    EXPECT_TRUE(fs::exists(layout.new_dir() / "1979-03-10_disco_1.png"));
    EXPECT_TRUE(fs::exists(outside / "1979-03-10 disco.png"));
}

TEST_F(JobControlTest, ImportRejectsMissingAndUnsupported) {
    EXPECT_TRUE(control->import_file(test_dir / "nothing.png").is_err());

    std::ofstream(test_dir / "1979-03-10.doc") << "x";
    auto r = control->import_file(test_dir / "1979-03-10.doc");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Unsupported"), std::string::npos);
}

TEST_F(JobControlTest, ScanRegistersOnlyUnknownFiles) {
    register_file("1979-03-10_a.png");
    drop_file("1979-03-17_b.jpg");
    drop_file("1979-03-24_c.pdf");
    drop_file("readme.txt");

    auto r = control->scan_new_dir();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].filename, "1979-03-17_b.jpg");
    EXPECT_EQ(r.value[1].filename, "1979-03-24_c.pdf");

    auto again = control->scan_new_dir();
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value.empty());
    EXPECT_EQ(store->list_jobs().size(), 3u);
}

// ── Job actions ─────────────────────────────────────────────

TEST_F(JobControlTest, RerunRequeuesFinishedJob) {
    Job job = register_file("1979-03-10_disco.png");
    store->update_job(job.id, [](Job& j) {
        j.status = JobStatus::Error;
        j.error = "No rows extracted";
        j.finished_at = now_iso();
        return true;
    });

    auto r = control->rerun(job.id);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.status, JobStatus::Queued);
    EXPECT_TRUE(r.value.error.empty());
    EXPECT_TRUE(r.value.finished_at.empty());
}

TEST_F(JobControlTest, RerunRefusesProcessingAndDeleted) {
    Job a = register_file("1979-03-10_a.png");
    Job b = register_file("1979-03-17_b.png");
    set_status(a.id, JobStatus::Processing);
    set_status(b.id, JobStatus::Deleted);

    EXPECT_EQ(control->rerun(a.id).error, "Job is processing");
    EXPECT_EQ(control->rerun(b.id).error, "Job is deleted");
    EXPECT_NE(control->rerun("unknown").error.find("Job not found"), std::string::npos);
}

TEST_F(JobControlTest, StopCancelsStoppableJobs) {
    Job job = register_file("1979-03-10_disco.png");
    set_status(job.id, JobStatus::Processing);

    auto r = control->stop(job.id);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.status, JobStatus::Cancelled);
    EXPECT_EQ(r.value.error, CANCELLED_BY_USER);
    EXPECT_EQ(store->get_job(job.id)->status, JobStatus::Cancelled);
}

TEST_F(JobControlTest, StopRefusesFinishedJob) {
    Job job = register_file("1979-03-10_disco.png");
    set_status(job.id, JobStatus::Completed);

    auto r = control->stop(job.id);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Job is completed");
    EXPECT_EQ(store->get_job(job.id)->status, JobStatus::Completed);
}

TEST_F(JobControlTest, DeleteRemovesFilesAndKeepsRecord) {
    Job job = register_file("1979-03-10_disco.png");
    std::ofstream(layout.new_dir() / "1979-03-10_disco_1.png") << "pending";
    store->update_job(job.id, [](Job& j) {
        j.status = JobStatus::Completed;
        j.pending_filename = "1979-03-10_disco_1.png";
        return true;
    });

    auto r = control->delete_job(job.id);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.status, JobStatus::Deleted);
    EXPECT_EQ(r.value.file_location, FileLocation::Missing);
    EXPECT_FALSE(r.value.pending_filename.has_value());
    EXPECT_FALSE(fs::exists(layout.new_dir() / "1979-03-10_disco.png"));
    EXPECT_FALSE(fs::exists(layout.new_dir() / "1979-03-10_disco_1.png"));
    EXPECT_TRUE(store->get_job(job.id).has_value());
}

TEST_F(JobControlTest, DeleteRefusesProcessingJob) {
    Job job = register_file("1979-03-10_disco.png");
    set_status(job.id, JobStatus::Processing);

    EXPECT_EQ(control->delete_job(job.id).error, "Job is processing");
    EXPECT_TRUE(fs::exists(layout.new_dir() / "1979-03-10_disco.png"));
}

TEST_F(JobControlTest, ConfirmPageRequeuesPdf) {
    Job job = register_file("1979-03-10_issue.pdf");
    store->update_job(job.id, [](Job& j) {
        j.status = JobStatus::AwaitingReview;
        j.pdf_page_count = 12;
        j.pdf_selected_page = 7;
        j.pdf_candidate_pages = "[7, 3]";
        return true;
    });

    auto r = control->confirm_page(job.id, 3);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.status, JobStatus::Queued);
    EXPECT_EQ(r.value.pdf_selected_page, 3);
    EXPECT_TRUE(r.value.pdf_page_confirmed);
    EXPECT_EQ(r.value.pdf_candidate_pages, "[7, 3]");
}

TEST_F(JobControlTest, ConfirmPageValidatesPageAndType) {
    Job pdf = register_file("1979-03-10_issue.pdf");
    Job png = register_file("1979-03-17_chart.png");
    store->update_job(pdf.id, [](Job& j) {
        j.status = JobStatus::AwaitingReview;
        j.pdf_page_count = 4;
        return true;
    });

    EXPECT_EQ(control->confirm_page(pdf.id, 0).error, "Page 0 is out of range 1-4");
    EXPECT_EQ(control->confirm_page(pdf.id, 5).error, "Page 5 is out of range 1-4");
    EXPECT_EQ(control->confirm_page(png.id, 1).error, "Job is not a PDF");
    EXPECT_FALSE(store->get_job(pdf.id)->pdf_page_confirmed);
}

// ── Settings ────────────────────────────────────────────────

TEST_F(JobControlTest, SettingsUpdateIsPartial) {
    SettingsUpdate u;
    u.concurrency = 4;
    auto r = control->update_settings(u);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.concurrency, 4);
    EXPECT_FALSE(r.value.paused);

    SettingsUpdate p;
    p.paused = true;
    p.model = "gemini-2.5-pro";
    r = control->update_settings(p);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.concurrency, 4);
    EXPECT_TRUE(r.value.paused);
    EXPECT_EQ(store->settings().model, "gemini-2.5-pro");
}

TEST_F(JobControlTest, SettingsRejectOutOfRangeValues) {
    SettingsUpdate zero;
    zero.concurrency = 0;
    EXPECT_TRUE(control->update_settings(zero).is_err());

    SettingsUpdate big;
    big.concurrency = MAX_CONCURRENCY + 1;
    EXPECT_TRUE(control->update_settings(big).is_err());

    SettingsUpdate blank;
    blank.model = "";
    EXPECT_TRUE(control->update_settings(blank).is_err());

    EXPECT_EQ(store->settings().concurrency, WorkerSettings{}.concurrency);
}

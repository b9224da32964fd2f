#include <gtest/gtest.h>
#include <managers/yaml_job_store.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

namespace fs = std::filesystem;

class JobStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("chartreader_store_test_" + generate_id(8));
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    Job make_job(const std::string& id, const std::string& created_at,
                 JobStatus status = JobStatus::Queued) {
        Job j;
        j.id = id;
        j.filename = id + "_1979-03-10.png";
        j.canonical_filename = j.filename;
        j.entry_date = std::string("1979-03-10");
        j.created_at = created_at;
        j.status = status;
        return j;
    }

    ::Run make_run(const std::string& run_id, const std::string& job_id, int rows = 0) {
        ::Run r;
        r.run_id = run_id;
        r.job_id = job_id;
        r.model = "gemini-2.5-flash";
        r.extracted_at = now_iso();
        r.rows_inserted = rows;
        return r;
    }

    std::vector<ChartRow> make_rows(const std::string& job_id, int n) {
        std::vector<ChartRow> rows;
        for (int i = 1; i <= n; ++i) {
            ChartRow r;
            r.job_id = job_id;
            r.entry_date = "1979-03-10";
            r.chart_title = "DISCO TOP 80";
            r.this_week_rank = i;
            r.title = "Song " + std::to_string(i);
            r.artist = "Artist";
            r.label = "Label";
            r.source_file = "a.png";
            rows.push_back(r);
        }
        return rows;
    }
};

TEST_F(JobStoreTest, EmptyStoreUsesDefaultSettings) {
    WorkerSettings defaults;
    defaults.concurrency = 4;
    defaults.model = "m1";
    YamlJobStore store(test_dir, defaults);
    EXPECT_TRUE(store.list_jobs().empty());
    EXPECT_EQ(store.settings().concurrency, 4);
    EXPECT_EQ(store.settings().model, "m1");
    EXPECT_FALSE(fs::exists(store.state_path()));
}

TEST_F(JobStoreTest, JobsSurviveReopen) {
    {
        YamlJobStore store(test_dir, {});
        auto j = make_job("a", "2025-01-01T00:00:00.000Z");
        j.pdf_candidate_pages = "[2, 4]";
        j.pending_filename = std::string("null");
        store.insert_job(j);
    }
    YamlJobStore reopened(test_dir, {});
    auto j = reopened.get_job("a");
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ(j->entry_date, std::optional<std::string>("1979-03-10"));
    EXPECT_EQ(j->pdf_candidate_pages, "[2, 4]");
    EXPECT_EQ(j->pending_filename, std::optional<std::string>("null"));
    EXPECT_EQ(j->status, JobStatus::Queued);
    EXPECT_FALSE(j->last_run_id.has_value());
}

TEST_F(JobStoreTest, DuplicateJobIdRejected) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));
    EXPECT_THROW(store.insert_job(make_job("a", "2025-01-02T00:00:00.000Z")), StoreError);
    EXPECT_EQ(store.list_jobs().size(), 1u);
}

TEST_F(JobStoreTest, ClaimOldestFirstUpToLimit) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("late", "2025-01-03T00:00:00.000Z"));
    store.insert_job(make_job("early", "2025-01-01T00:00:00.000Z"));
    store.insert_job(make_job("mid", "2025-01-02T00:00:00.000Z"));
    store.insert_job(make_job("done", "2024-01-01T00:00:00.000Z", JobStatus::Completed));

    auto claimed = store.claim_queued(2);
    ASSERT_EQ(claimed.size(), 2u);
    EXPECT_EQ(claimed[0].id, "early");
    EXPECT_EQ(claimed[1].id, "mid");
    EXPECT_EQ(claimed[0].status, JobStatus::Processing);
    EXPECT_EQ(claimed[0].progress_step, "starting");
    EXPECT_FALSE(claimed[0].started_at.empty());
    EXPECT_EQ(store.count_processing(), 2);
    EXPECT_TRUE(store.claim_queued(0).empty());
}

TEST_F(JobStoreTest, ConcurrentClaimsNeverDuplicate) {
    YamlJobStore store(test_dir, {});
    for (int i = 0; i < 30; ++i) {
        store.insert_job(make_job(fmt::format("job{:02}", i), fmt::format("2025-01-01T00:00:{:02}.000Z", i)));
    }

    // Two store objects on the same files behave like two processes.
    YamlJobStore other(test_dir, {});
    std::vector<std::string> a, b;
    std::thread t1([&] { for (int i = 0; i < 20; ++i) for (auto& j : store.claim_queued(1)) a.push_back(j.id); });
    std::thread t2([&] { for (int i = 0; i < 20; ++i) for (auto& j : other.claim_queued(1)) b.push_back(j.id); });
    t1.join();
    t2.join();

    std::set<std::string> all(a.begin(), a.end());
    for (const auto& id : b) {
        EXPECT_TRUE(all.insert(id).second) << "claimed twice: " << id;
    }
    EXPECT_EQ(all.size(), 30u);
    EXPECT_EQ(store.count_processing(), 30);
}

TEST_F(JobStoreTest, UpdateJobConditional) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));

    auto unchanged = store.update_job("a", [](Job& j) {
        if (j.status != JobStatus::Processing) return false;
        j.status = JobStatus::Completed;
        return true;
    });
    ASSERT_TRUE(unchanged.has_value());
    EXPECT_EQ(unchanged->status, JobStatus::Queued);

    auto changed = store.update_job("a", [](Job& j) {
        j.id = "renamed";
        j.error = "boom";
        return true;
    });
    ASSERT_TRUE(changed.has_value());
    EXPECT_EQ(changed->id, "a");
    EXPECT_EQ(store.get_job("a")->error, "boom");

    EXPECT_FALSE(store.update_job("missing", [](Job&) { return true; }).has_value());
}

TEST_F(JobStoreTest, ThrowingMutatorLeavesStateIntact) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));
    EXPECT_THROW(store.update_job("a", [](Job& j) -> bool {
        j.error = "half-written";
        throw StoreError("abort");
    }), StoreError);
    EXPECT_EQ(store.get_job("a")->error, "");
}

TEST_F(JobStoreTest, CanonicalLookupSkipsDeleted) {
    YamlJobStore store(test_dir, {});
    auto old = make_job("old", "2025-01-01T00:00:00.000Z", JobStatus::Deleted);
    old.canonical_filename = "chart.png";
    auto live = make_job("live", "2025-01-02T00:00:00.000Z");
    live.canonical_filename = "chart.png";
    store.insert_job(old);
    store.insert_job(live);

    auto found = store.find_live_by_canonical("chart.png");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "live");
    EXPECT_FALSE(store.find_live_by_canonical("other.png").has_value());
}

TEST_F(JobStoreTest, FilenameInUse) {
    YamlJobStore store(test_dir, {});
    auto j = make_job("a", "2025-01-01T00:00:00.000Z");
    j.pending_filename = std::string("next.png");
    store.insert_job(j);
    auto gone = make_job("gone", "2025-01-01T00:00:00.000Z", JobStatus::Deleted);
    gone.filename = "gone.png";
    store.insert_job(gone);

    EXPECT_TRUE(store.filename_in_use(j.filename));
    EXPECT_TRUE(store.filename_in_use("next.png"));
    EXPECT_FALSE(store.filename_in_use(j.filename, "a"));
    EXPECT_FALSE(store.filename_in_use("gone.png"));
    EXPECT_FALSE(store.filename_in_use("free.png"));
}

TEST_F(JobStoreTest, RequeueProcessing) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z", JobStatus::Processing));
    store.insert_job(make_job("b", "2025-01-01T00:00:00.000Z", JobStatus::Completed));
    EXPECT_EQ(store.requeue_processing(), 1);
    EXPECT_EQ(store.get_job("a")->status, JobStatus::Queued);
    EXPECT_EQ(store.get_job("b")->status, JobStatus::Completed);
    EXPECT_EQ(store.requeue_processing(), 0);
}

TEST_F(JobStoreTest, PersistRunWithRowsActivates) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));

    auto run = make_run("r1", "a", 3);
    run.raw_result_json = R"({"attempts": []})";
    auto rows = make_rows("a", 3);
    store.persist_run_with_rows(run, rows, true);

    EXPECT_EQ(rows[0].id, 1);
    EXPECT_EQ(rows[2].id, 3);
    EXPECT_EQ(rows[0].run_id, "r1");

    auto job = store.get_job("a");
    EXPECT_EQ(job->run_count, 1);
    EXPECT_EQ(job->last_run_id, std::optional<std::string>("r1"));
    EXPECT_EQ(job->rows_appended_last_run, 3);

    auto stored = store.rows_for_run("r1");
    ASSERT_EQ(stored.size(), 3u);
    EXPECT_EQ(stored[1].this_week_rank, 2);
    EXPECT_FALSE(stored[1].last_week_rank.has_value());

    EXPECT_EQ(store.run_payload("r1"), R"({"attempts": []})");
    EXPECT_EQ(store.get_run("r1")->raw_result_json, R"({"attempts": []})");
    EXPECT_TRUE(store.runs_for_job("a")[0].raw_result_json.empty());

    // Ids keep increasing across runs.
    auto more = make_rows("a", 1);
    store.persist_run_with_rows(make_run("r2", "a", 1), more, false);
    EXPECT_EQ(more[0].id, 4);
    EXPECT_EQ(store.get_job("a")->last_run_id, std::optional<std::string>("r1"));
    EXPECT_EQ(store.get_job("a")->run_count, 2);
}

TEST_F(JobStoreTest, EmptyRunIsNeverActivated) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));
    auto rows = make_rows("a", 2);
    store.persist_run_with_rows(make_run("r1", "a", 2), rows, true);

    std::vector<ChartRow> none;
    store.persist_run_with_rows(make_run("r2", "a", 0), none, true);

    auto job = store.get_job("a");
    EXPECT_EQ(job->run_count, 2);
    EXPECT_EQ(job->last_run_id, std::optional<std::string>("r1"));
    EXPECT_EQ(job->rows_appended_last_run, 2);
}

TEST_F(JobStoreTest, PersistRunRejectsUnknownJobAndDuplicates) {
    YamlJobStore store(test_dir, {});
    auto rows = make_rows("ghost", 2);
    EXPECT_THROW(store.persist_run_with_rows(make_run("r1", "ghost", 2), rows, true), StoreError);
    EXPECT_TRUE(store.rows_for_run("r1").empty());

    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));
    store.insert_run(make_run("r1", "a"));
    EXPECT_THROW(store.insert_run(make_run("r1", "a")), StoreError);
    EXPECT_EQ(store.get_job("a")->run_count, 1);
}

TEST_F(JobStoreTest, InsertRowsAppendsToRun) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));
    store.insert_run(make_run("r1", "a"));

    auto rows = make_rows("a", 2);
    for (auto& r : rows) r.run_id = "r1";
    store.insert_rows(rows);
    EXPECT_EQ(store.rows_for_run("r1").size(), 2u);

    auto orphan = make_rows("a", 1);
    orphan[0].run_id = "nope";
    EXPECT_THROW(store.insert_rows(orphan), StoreError);
}

TEST_F(JobStoreTest, RunStatusAndSourceFileUpdates) {
    YamlJobStore store(test_dir, {});
    store.insert_job(make_job("a", "2025-01-01T00:00:00.000Z"));
    auto rows = make_rows("a", 2);
    store.persist_run_with_rows(make_run("r1", "a", 2), rows, true);

    store.update_run_status("r1", RunStatus::Cancelled, "Cancelled by user");
    auto run = store.get_run("r1");
    EXPECT_EQ(run->status, RunStatus::Cancelled);
    EXPECT_EQ(run->error, "Cancelled by user");
    EXPECT_THROW(store.update_run_status("nope", RunStatus::Error, ""), StoreError);

    store.update_rows_source_file("r1", "a_1.png");
    for (const auto& r : store.rows_for_run("r1")) EXPECT_EQ(r.source_file, "a_1.png");
}

TEST_F(JobStoreTest, SettingsPersistAcrossInstances) {
    YamlJobStore a(test_dir, {});
    YamlJobStore b(test_dir, {});
    a.update_settings([](WorkerSettings& s) {
        s.concurrency = 5;
        s.paused = true;
    });
    EXPECT_EQ(b.settings().concurrency, 5);
    EXPECT_TRUE(b.settings().paused);
}

TEST_F(JobStoreTest, SecondInstanceSeesWrites) {
    YamlJobStore a(test_dir, {});
    YamlJobStore b(test_dir, {});
    a.insert_job(make_job("x", "2025-01-01T00:00:00.000Z"));
    EXPECT_TRUE(b.get_job("x").has_value());
    b.update_job("x", [](Job& j) { j.error = "from b"; return true; });
    EXPECT_EQ(a.get_job("x")->error, "from b");
}

TEST_F(JobStoreTest, CorruptStateIsStoreError) {
    std::ofstream(test_dir / "state.yaml") << "jobs: [ {id: a, status: nonsense} ]\n";
    YamlJobStore store(test_dir, {});
    EXPECT_THROW(store.list_jobs(), StoreError);

    std::ofstream(test_dir / "state.yaml") << "jobs: [ {unclosed\n";
    YamlJobStore broken(test_dir, {});
    EXPECT_THROW(broken.list_jobs(), StoreError);
}

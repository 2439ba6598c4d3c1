/**
 * Concurrency tests
 *
 * Several tim processes share one database file. These tests run writers
 * on separate connections (threads with their own handle, and forked
 * processes) and check that no plan id is handed out twice and that racing
 * creators agree on a single project row.
 */

#include "test_utils.h"

#include <algorithm>
#include <set>
#include <thread>

namespace {

class ConcurrencyTest : public TimdbTest {
  protected:
	static constexpr int WORKERS = 4;
	static constexpr int RESERVATIONS = 25;

	void SetUp() override {
		TimdbTest::SetUp();
		// Create the file up front so the workers only race on data
		db();
	}
};

TEST_F(ConcurrencyTest, ThreadsReserveDisjointPlanIds) {
	std::vector<std::vector<int64_t>> reserved(WORKERS);
	std::vector<std::string> errors(WORKERS);
	std::vector<std::thread> workers;

	for (int i = 0; i < WORKERS; ++i) {
		workers.emplace_back([this, i, &reserved, &errors]() {
			try {
				auto handle = timdb::db::Database::open(db_path);
				for (int n = 0; n < RESERVATIONS; ++n) {
					auto block = timdb::Projects::reserve_next_plan_id(*handle, "repo-a", 0, 2);
					reserved[i].push_back(block.first);
					reserved[i].push_back(block.second);
				}
			} catch (const std::exception &exc) {
				errors[i] = exc.what();
			}
		});
	}
	for (auto &worker : workers) {
		worker.join();
	}

	for (const auto &err : errors) {
		EXPECT_TRUE(err.empty()) << err;
	}

	std::set<int64_t> ids;
	for (const auto &list : reserved) {
		ids.insert(list.begin(), list.end());
	}
	const int64_t total = WORKERS * RESERVATIONS * 2;
	EXPECT_EQ(static_cast<int64_t>(ids.size()), total) << "every reserved id is unique";
	EXPECT_EQ(*ids.begin(), 1);
	EXPECT_EQ(*ids.rbegin(), total);
	EXPECT_EQ(timdb::Projects::get(db(), "repo-a")->highest_plan_id, total);
}

TEST_F(ConcurrencyTest, SharedHandleIsSafeAcrossThreads) {
	std::vector<int64_t> project_ids(WORKERS);
	std::vector<std::thread> workers;

	for (int i = 0; i < WORKERS; ++i) {
		workers.emplace_back([this, i, &project_ids]() {
			auto &database = db();
			for (int n = 0; n < RESERVATIONS; ++n) {
				project_ids[i] = timdb::Projects::get_or_create(database, "repo-shared").id;
				timdb::Projects::reserve_next_plan_id(database, "repo-shared", 0, 1);
			}
		});
	}
	for (auto &worker : workers) {
		worker.join();
	}

	EXPECT_TRUE(std::all_of(project_ids.begin(), project_ids.end(),
							[&](int64_t id) { return id == project_ids.front(); }));
	EXPECT_EQ(timdb::Projects::get(db(), "repo-shared")->highest_plan_id, WORKERS * RESERVATIONS);
}

TEST_F(ConcurrencyTest, ProcessesAgreeOnProjectAndIds) {
	// The children must not inherit an open connection
	timdb::db::StorageManager::reset();

	std::vector<pid_t> children;
	for (int i = 0; i < WORKERS; ++i) {
		pid_t child = fork();
		ASSERT_GE(child, 0);
		if (child == 0) {
			int status = 0;
			try {
				auto handle = timdb::db::Database::open(db_path);
				auto project = timdb::Projects::get_or_create(*handle, "repo-forked");
				std::ofstream out(tmp_dir + "/child_" + std::to_string(i) + ".txt");
				out << project.id << "\n";
				for (int n = 0; n < RESERVATIONS; ++n) {
					out << timdb::Projects::reserve_next_plan_id(*handle, "repo-forked", 0, 1).first << "\n";
				}
			} catch (const std::exception &exc) {
				std::cerr << "child " << i << " failed: " << exc.what() << std::endl;
				status = 1;
			}
			_exit(status);
		}
		children.push_back(child);
	}

	for (pid_t child : children) {
		int status = 0;
		ASSERT_EQ(waitpid(child, &status, 0), child);
		ASSERT_TRUE(WIFEXITED(status));
		EXPECT_EQ(WEXITSTATUS(status), 0);
	}

	std::set<int64_t> project_ids;
	std::set<int64_t> plan_ids;
	for (int i = 0; i < WORKERS; ++i) {
		std::ifstream in(tmp_dir + "/child_" + std::to_string(i) + ".txt");
		int64_t value;
		ASSERT_TRUE(in >> value);
		project_ids.insert(value);
		while (in >> value) {
			EXPECT_TRUE(plan_ids.insert(value).second) << "plan id " << value << " handed out twice";
		}
	}

	EXPECT_EQ(project_ids.size(), 1u);
	EXPECT_EQ(static_cast<int>(plan_ids.size()), WORKERS * RESERVATIONS);
	auto project = timdb::Projects::get(db(), "repo-forked");
	ASSERT_TRUE(project);
	EXPECT_EQ(project->highest_plan_id, WORKERS * RESERVATIONS);
	EXPECT_EQ(timdb::Projects::list(db()).size(), 1u);
}

} // namespace

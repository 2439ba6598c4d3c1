#include "test_utils.h"

#include <set>

namespace {

class MigrationTest : public TimdbTest {
  protected:
	std::set<std::string> table_names(sqlite3 *db) {
		std::set<std::string> names;
		sqlite3_stmt *stmt = nullptr;
		sqlite3_prepare_v2(db, "SELECT name FROM sqlite_master WHERE type = 'table'", -1, &stmt, nullptr);
		while (sqlite3_step(stmt) == SQLITE_ROW) {
			names.insert(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
		}
		sqlite3_finalize(stmt);
		return names;
	}
};

TEST_F(MigrationTest, FreshDatabaseIsAtLatestVersion) {
	auto &database = db();
	EXPECT_TRUE(database.created());
	EXPECT_EQ(timdb::db::current_schema_version(database.get()), timdb::db::schema_migrations().back().version);

	auto tables = table_names(database.get());
	for (const char *name : {"schema_version", "project", "workspace", "workspace_issue", "workspace_lock",
							 "permission", "assignment"}) {
		EXPECT_TRUE(tables.count(name)) << "missing table " << name;
	}

	auto version = database.storage().get_pointer<timdb::db::SchemaVersion>(1);
	ASSERT_TRUE(version);
	EXPECT_EQ(version->import_completed, 1) << "an empty config root still counts as imported";
}

TEST_F(MigrationTest, ConnectionPragmas) {
	auto &database = db();
	EXPECT_EQ(query_text(database.get(), "PRAGMA journal_mode"), "wal");
	EXPECT_EQ(query_text(database.get(), "PRAGMA foreign_keys"), "1");
	// NORMAL
	EXPECT_EQ(query_text(database.get(), "PRAGMA synchronous"), "1");
}

TEST_F(MigrationTest, ReopenIsIdempotent) {
	auto project = make_project("repo-a");
	timdb::db::StorageManager::reset();

	auto &database = db();
	EXPECT_FALSE(database.created());
	EXPECT_EQ(timdb::db::current_schema_version(database.get()), timdb::db::schema_migrations().back().version);

	auto reread = timdb::Projects::get(database, "repo-a");
	ASSERT_TRUE(reread);
	EXPECT_EQ(reread->id, project.id);
}

TEST_F(MigrationTest, UpgradesFromOlderVersion) {
	// Build a version 1 database by hand, with data in it
	{
		auto raw = open_sqlite3_db(db_path);
		std::vector<timdb::db::Migration> first_only = {timdb::db::schema_migrations().front()};
		timdb::db::run_migrations(raw.get(), first_only);
		EXPECT_EQ(timdb::db::current_schema_version(raw.get()), 1);
		ASSERT_EQ(sqlite3_exec(raw.get(), "INSERT INTO project (repository_id) VALUES ('old-repo')", nullptr, nullptr,
							   nullptr),
				  SQLITE_OK);
		EXPECT_EQ(table_names(raw.get()).count("assignment"), 0u);
	}

	auto &database = db();
	EXPECT_EQ(timdb::db::current_schema_version(database.get()), 2);
	EXPECT_EQ(table_names(database.get()).count("assignment"), 1u);
	EXPECT_TRUE(timdb::Projects::get(database, "old-repo"));
}

TEST_F(MigrationTest, RefusesNewerSchema) {
	{
		auto raw = open_sqlite3_db(db_path);
		timdb::db::run_migrations(raw.get(), timdb::db::schema_migrations());
		ASSERT_EQ(sqlite3_exec(raw.get(), "UPDATE schema_version SET version = 99", nullptr, nullptr, nullptr),
				  SQLITE_OK);
	}

	try {
		timdb::db::Database::open(db_path);
		FAIL() << "opening a newer database should fail";
	} catch (const timdb::Error &err) {
		EXPECT_EQ(err.code(), timdb::ErrorCode::MigrationFailed);
		EXPECT_NE(std::string(err.what()).find("newer"), std::string::npos);
	}

	char *raw_err = nullptr;
	char *raw_output = nullptr;
	int rv = timdb_get_project("repo-a", &raw_output, &raw_err);
	UniqueCString err(raw_err);
	UniqueCString output(raw_output);
	EXPECT_EQ(rv, TIMDB_ERR_MIGRATION_FAILED);
	EXPECT_TRUE(err);
}

TEST_F(MigrationTest, FailedScriptRollsBackEverything) {
	auto raw = open_sqlite3_db(db_path);
	std::vector<timdb::db::Migration> migrations = {
		{1, "CREATE TABLE first_table (id INTEGER PRIMARY KEY)"},
		{2, "CREATE TABLE second_table (id INTEGER PRIMARY KEY); THIS IS NOT SQL"},
	};

	try {
		timdb::db::run_migrations(raw.get(), migrations);
		FAIL() << "a broken migration should throw";
	} catch (const timdb::Error &err) {
		EXPECT_EQ(err.code(), timdb::ErrorCode::MigrationFailed);
	}

	auto tables = table_names(raw.get());
	EXPECT_EQ(tables.count("first_table"), 0u);
	EXPECT_EQ(tables.count("second_table"), 0u);
	EXPECT_EQ(timdb::db::current_schema_version(raw.get()), 0);
}

TEST_F(MigrationTest, UnopenableDatabase) {
	// A directory where the file should be
	std::filesystem::create_directories(tmp_dir + "/blocked/tim.db");
	try {
		timdb::db::Database::open(tmp_dir + "/blocked/tim.db");
		FAIL() << "opening a directory as a database should fail";
	} catch (const timdb::Error &err) {
		EXPECT_EQ(err.code(), timdb::ErrorCode::StorageUnavailable);
	}
}

TEST_F(MigrationTest, ConstraintsAreEnforced) {
	auto project = make_project("repo-a");

	timdb::WorkspaceInput input;
	input.project_id = project.id + 100;
	input.workspace_path = "/tmp/nowhere";
	try {
		timdb::Workspaces::record(db(), input);
		FAIL() << "a workspace with an unknown project should be rejected";
	} catch (const timdb::Error &err) {
		EXPECT_EQ(err.code(), timdb::ErrorCode::ConstraintViolation);
	}
}

} // namespace

/**
 * Common test utilities for the timdb test suite
 *
 * This header provides shared RAII wrappers, fixtures and helper functions
 * used across multiple test files.
 */

#ifndef TIMDB_TEST_UTILS_H
#define TIMDB_TEST_UTILS_H

#include "../src/timdb.h"
#include "../src/timdb_db.h"
#include "../src/timdb_internal.h"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

// RAII wrappers for C-style memory management
struct CStringDeleter {
	void operator()(char *ptr) const {
		if (ptr)
			timdb_free_string(ptr);
	}
};
using UniqueCString = std::unique_ptr<char, CStringDeleter>;

// RAII wrapper for sqlite3 database connections
struct Sqlite3Deleter {
	void operator()(sqlite3 *db) const {
		if (db)
			sqlite3_close(db);
	}
};
using UniqueSqlite3 = std::unique_ptr<sqlite3, Sqlite3Deleter>;

/**
 * Helper to open a sqlite3 database with RAII management.
 * @param path The path to the database file
 * @return A unique_ptr managing the sqlite3 connection
 * @throws std::runtime_error if the database cannot be opened
 */
inline UniqueSqlite3 open_sqlite3_db(const std::string &path) {
	sqlite3 *db = nullptr;
	int rc = sqlite3_open(path.c_str(), &db);
	if (rc != SQLITE_OK) {
		if (db) {
			std::string err = sqlite3_errmsg(db);
			sqlite3_close(db);
			throw std::runtime_error("Failed to open database: " + err);
		}
		throw std::runtime_error("Failed to open database");
	}
	return UniqueSqlite3(db);
}

/**
 * Run a single-value query on a raw connection and return the first column as text.
 */
inline std::string query_text(sqlite3 *db, const std::string &sql) {
	sqlite3_stmt *stmt = nullptr;
	if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
		throw std::runtime_error("Failed to prepare: " + std::string(sqlite3_errmsg(db)));
	}
	std::string value;
	if (sqlite3_step(stmt) == SQLITE_ROW) {
		const unsigned char *text = sqlite3_column_text(stmt, 0);
		value = text ? reinterpret_cast<const char *>(text) : "";
	}
	sqlite3_finalize(stmt);
	return value;
}

/**
 * Creates a unique temporary directory for test isolation.
 * @param prefix The prefix to use in the directory name template (e.g., "timdb_test")
 * @return The path to the created temporary directory
 */
inline std::string create_temp_directory(const std::string &prefix = "timdb_test") {
	std::string temp_dir_template = "/tmp/" + prefix + "_XXXXXX";
	std::vector<char> temp_dir_name(temp_dir_template.begin(), temp_dir_template.end());
	temp_dir_name.push_back('\0');

	char *mkdtemp_result = mkdtemp(temp_dir_name.data());
	if (mkdtemp_result == nullptr) {
		std::cerr << "Failed to create temporary directory\n";
		exit(1);
	}

	return std::string(mkdtemp_result);
}

/**
 * Write a JSON document, creating parent directories as needed.
 */
inline void write_json_file(const std::filesystem::path &path, const nlohmann::json &document) {
	std::filesystem::create_directories(path.parent_path());
	std::ofstream out(path);
	out << document.dump(2) << "\n";
}

inline void write_text_file(const std::filesystem::path &path, const std::string &contents) {
	std::filesystem::create_directories(path.parent_path());
	std::ofstream out(path);
	out << contents;
}

/**
 * Fork a child that exits immediately and reap it.
 * @return A pid that no longer names a running process
 */
inline pid_t dead_pid() {
	pid_t child = fork();
	if (child == 0) {
		_exit(0);
	}
	int status = 0;
	waitpid(child, &status, 0);
	return child;
}

/**
 * Fixture that points the shared database at a fresh temporary directory.
 */
class TimdbTest : public ::testing::Test {
  protected:
	std::string tmp_dir;
	std::string db_path;

	void SetUp() override {
		tmp_dir = create_temp_directory();
		db_path = tmp_dir + "/tim.db";
		timdb::db::StorageManager::reset_for_testing(db_path);
	}

	void TearDown() override {
		timdb::db::StorageManager::reset_for_testing("");
		std::filesystem::remove_all(tmp_dir);
	}

	timdb::db::Database &db() {
		return timdb::db::StorageManager::shared();
	}

	timdb::Project make_project(const std::string &repository_id = "repo-a") {
		return timdb::Projects::get_or_create(db(), repository_id);
	}

	timdb::Workspace make_workspace(int64_t project_id, const std::string &path,
									const std::string &task_id = "task-1") {
		timdb::WorkspaceInput input;
		input.project_id = project_id;
		input.workspace_path = path;
		input.task_id = task_id;
		return timdb::Workspaces::record(db(), input);
	}

	/**
	 * Overwrite a column through a second connection, e.g. to age a row.
	 */
	void exec_raw(const std::string &sql) {
		auto raw = open_sqlite3_db(db_path);
		char *err = nullptr;
		int rc = sqlite3_exec(raw.get(), sql.c_str(), nullptr, nullptr, &err);
		std::string message = err ? err : "";
		sqlite3_free(err);
		ASSERT_EQ(rc, SQLITE_OK) << message;
	}
};

#endif // TIMDB_TEST_UTILS_H

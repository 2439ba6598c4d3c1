/**
 * Database layer for timdb
 *
 * Connection handling, migrations, transactions and the process-wide
 * storage manager. Repository code lives in timdb_internal.cpp and
 * timdb_lock.cpp.
 */

#include "timdb_db.h"

#include "timdb.h"
#include "timdb_import.h"
#include "timdb_internal.h"
#include "timdb_log.h"

#include <cerrno>
#include <cstring>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace sqlite_orm;

namespace timdb {

const char *error_code_name(ErrorCode code) {
	switch (code) {
		case ErrorCode::StorageUnavailable:
			return "StorageUnavailable";
		case ErrorCode::MigrationFailed:
			return "MigrationFailed";
		case ErrorCode::Busy:
			return "Busy";
		case ErrorCode::ConstraintViolation:
			return "ConstraintViolation";
		case ErrorCode::AlreadyLocked:
			return "AlreadyLocked";
		case ErrorCode::InvalidArgument:
			return "InvalidArgument";
		case ErrorCode::StorageError:
			return "StorageError";
	}
	return "Unknown";
}

namespace db {

// Static member definitions
std::unique_ptr<Database> StorageManager::m_database = nullptr;
std::string StorageManager::m_path_override;
std::mutex StorageManager::m_mutex;

namespace {

ErrorCode code_for_sqlite(int rc) {
	switch (rc & 0xff) {
		case SQLITE_BUSY:
		case SQLITE_LOCKED:
			return ErrorCode::Busy;
		case SQLITE_CONSTRAINT:
			return ErrorCode::ConstraintViolation;
		case SQLITE_CANTOPEN:
		case SQLITE_NOTADB:
		case SQLITE_PERM:
			return ErrorCode::StorageUnavailable;
		default:
			return ErrorCode::StorageError;
	}
}

// Schema version 1: projects and their workspaces.
const char *MIGRATION_V1 = R"SQL(
CREATE TABLE project (
	id INTEGER PRIMARY KEY,
	repository_id TEXT NOT NULL UNIQUE,
	remote_url TEXT,
	last_git_root TEXT,
	external_config_path TEXT,
	external_tasks_dir TEXT,
	remote_label TEXT,
	highest_plan_id INTEGER NOT NULL DEFAULT 0,
	created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
	updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))
);

CREATE TABLE workspace (
	id INTEGER PRIMARY KEY,
	project_id INTEGER NOT NULL REFERENCES project(id) ON DELETE CASCADE,
	task_id TEXT,
	workspace_path TEXT NOT NULL UNIQUE,
	original_plan_file_path TEXT,
	branch TEXT,
	name TEXT,
	description TEXT,
	plan_id TEXT,
	plan_title TEXT,
	created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
	updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))
);
CREATE INDEX idx_workspace_project_id ON workspace(project_id);
CREATE INDEX idx_workspace_task_id ON workspace(task_id);

CREATE TABLE workspace_issue (
	id INTEGER PRIMARY KEY,
	workspace_id INTEGER NOT NULL REFERENCES workspace(id) ON DELETE CASCADE,
	issue_url TEXT NOT NULL,
	UNIQUE(workspace_id, issue_url)
);

CREATE TABLE workspace_lock (
	workspace_id INTEGER PRIMARY KEY REFERENCES workspace(id) ON DELETE CASCADE,
	lock_type TEXT NOT NULL CHECK (lock_type IN ('persistent', 'pid')),
	pid INTEGER,
	started_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
	hostname TEXT NOT NULL,
	command TEXT NOT NULL
);
)SQL";

// Schema version 2: shared state that used to live in per-repository JSON files.
const char *MIGRATION_V2 = R"SQL(
CREATE TABLE permission (
	id INTEGER PRIMARY KEY,
	project_id INTEGER NOT NULL REFERENCES project(id) ON DELETE CASCADE,
	permission_type TEXT NOT NULL CHECK (permission_type IN ('allow', 'deny')),
	pattern TEXT NOT NULL,
	UNIQUE(project_id, permission_type, pattern)
);
CREATE INDEX idx_permission_project_id ON permission(project_id);

CREATE TABLE assignment (
	id INTEGER PRIMARY KEY,
	project_id INTEGER NOT NULL REFERENCES project(id) ON DELETE CASCADE,
	plan_uuid TEXT NOT NULL,
	plan_id INTEGER,
	workspace_id INTEGER REFERENCES workspace(id) ON DELETE SET NULL,
	claimed_by_user TEXT,
	status TEXT,
	assigned_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
	updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
	UNIQUE(project_id, plan_uuid)
);
CREATE INDEX idx_assignment_workspace_id ON assignment(workspace_id);
)SQL";

std::string parent_directory(const std::string &path) {
	auto pos = path.find_last_of('/');
	if (pos == std::string::npos) {
		return ".";
	}
	if (pos == 0) {
		return "/";
	}
	return path.substr(0, pos);
}

} // namespace

Error error_from_sqlite(sqlite3 *db, int rc, const std::string &context) {
	std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
	return Error(code_for_sqlite(rc), context + ": sqlite errno: " + std::to_string(rc) + " - " + detail);
}

Error error_from_system_error(const std::system_error &err) {
	if (err.code().category() == sqlite_orm::get_sqlite_error_category()) {
		return Error(code_for_sqlite(err.code().value()), err.what());
	}
	return Error(ErrorCode::StorageError, err.what());
}

// Raw SQL helpers

StmtGuard prepare(sqlite3 *db, const std::string &query) {
	sqlite3_stmt *stmt = nullptr;
	int rc = sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, nullptr);
	if (rc != SQLITE_OK) {
		if (stmt) {
			sqlite3_finalize(stmt);
		}
		throw error_from_sqlite(db, rc, "Call to sqlite3_prepare_v2 failed");
	}
	return StmtGuard(stmt);
}

void exec(sqlite3 *db, const std::string &sql) {
	char *err = nullptr;
	int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
	if (rc != SQLITE_OK) {
		std::string msg = err ? err : sqlite3_errstr(rc);
		sqlite3_free(err);
		throw Error(code_for_sqlite(rc), "Failed to execute SQL: sqlite errno: " + std::to_string(rc) + " - " + msg);
	}
}

void bind_text(sqlite3_stmt *stmt, int pos, const std::string &value) {
	int rc = sqlite3_bind_text(stmt, pos, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
	if (rc != SQLITE_OK) {
		throw error_from_sqlite(sqlite3_db_handle(stmt), rc, "Call to sqlite3_bind_text failed");
	}
}

void bind_optional_text(sqlite3_stmt *stmt, int pos, const std::optional<std::string> &value) {
	if (!value) {
		int rc = sqlite3_bind_null(stmt, pos);
		if (rc != SQLITE_OK) {
			throw error_from_sqlite(sqlite3_db_handle(stmt), rc, "Call to sqlite3_bind_null failed");
		}
		return;
	}
	bind_text(stmt, pos, *value);
}

void bind_int64(sqlite3_stmt *stmt, int pos, int64_t value) {
	int rc = sqlite3_bind_int64(stmt, pos, value);
	if (rc != SQLITE_OK) {
		throw error_from_sqlite(sqlite3_db_handle(stmt), rc, "Call to sqlite3_bind_int64 failed");
	}
}

void bind_optional_int64(sqlite3_stmt *stmt, int pos, const std::optional<int64_t> &value) {
	if (!value) {
		int rc = sqlite3_bind_null(stmt, pos);
		if (rc != SQLITE_OK) {
			throw error_from_sqlite(sqlite3_db_handle(stmt), rc, "Call to sqlite3_bind_null failed");
		}
		return;
	}
	bind_int64(stmt, pos, *value);
}

bool step(sqlite3_stmt *stmt) {
	int rc = sqlite3_step(stmt);
	if (rc == SQLITE_ROW) {
		return true;
	}
	if (rc == SQLITE_DONE) {
		return false;
	}
	throw error_from_sqlite(sqlite3_db_handle(stmt), rc, "Error stepping through results");
}

std::string column_text(sqlite3_stmt *stmt, int col) {
	const unsigned char *data = sqlite3_column_text(stmt, col);
	return data ? reinterpret_cast<const char *>(data) : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, int col) {
	if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
		return std::nullopt;
	}
	return column_text(stmt, col);
}

int64_t column_int64(sqlite3_stmt *stmt, int col) {
	return sqlite3_column_int64(stmt, col);
}

std::optional<int64_t> column_optional_int64(sqlite3_stmt *stmt, int col) {
	if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
		return std::nullopt;
	}
	return sqlite3_column_int64(stmt, col);
}

// Migrations

const std::vector<Migration> &schema_migrations() {
	static const std::vector<Migration> migrations = {
		{1, MIGRATION_V1},
		{2, MIGRATION_V2},
	};
	return migrations;
}

int current_schema_version(sqlite3 *db) {
	auto exists = prepare(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'schema_version'");
	if (!step(exists.get())) {
		return 0;
	}

	auto stmt = prepare(db, "SELECT version FROM schema_version WHERE id = 1");
	if (!step(stmt.get())) {
		return 0;
	}
	return static_cast<int>(column_int64(stmt.get(), 0));
}

void run_migrations(sqlite3 *db, const std::vector<Migration> &migrations) {
	// BEGIN IMMEDIATE so two processes creating the file at once serialize here
	exec(db, "BEGIN IMMEDIATE");

	try {
		exec(db, "CREATE TABLE IF NOT EXISTS schema_version ("
				 "id INTEGER PRIMARY KEY CHECK (id = 1), "
				 "version INTEGER NOT NULL, "
				 "import_completed INTEGER NOT NULL DEFAULT 0)");
		exec(db, "INSERT OR IGNORE INTO schema_version (id, version, import_completed) VALUES (1, 0, 0)");

		int current_version = current_schema_version(db);
		int target_version = migrations.empty() ? 0 : migrations.back().version;

		if (current_version > target_version) {
			throw Error(ErrorCode::MigrationFailed,
						"Database schema version (" + std::to_string(current_version) +
							") is newer than supported version (" + std::to_string(target_version) +
							"). Cannot downgrade. Please use a newer version of the application.");
		}

		for (const auto &migration : migrations) {
			if (migration.version <= current_version) {
				continue;
			}

			try {
				exec(db, migration.sql);
			} catch (const Error &err) {
				throw Error(ErrorCode::MigrationFailed,
							"Migration to schema version " + std::to_string(migration.version) + " failed: " + err.what());
			}

			auto stmt = prepare(db, "UPDATE schema_version SET version = ? WHERE id = 1");
			bind_int64(stmt.get(), 1, migration.version);
			step(stmt.get());

			TIMDB_LOG_INFO("Applied schema migration", {log::int_field("version", migration.version)});
		}

		exec(db, "COMMIT");
	} catch (const Error &) {
		sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
		throw;
	}
}

// Database implementation

Database::Database(const std::string &db_path) : m_path(db_path) {}

Database::~Database() {
	// Drops the ORM storage, which closes the connection it opened forever
	m_storage.reset();
	m_db = nullptr;
}

std::unique_ptr<Database> Database::open(const std::string &db_path) {
	std::unique_ptr<Database> database(new Database(db_path));
	database->connect();

	try {
		run_migrations(database->m_db, schema_migrations());
	} catch (const Error &err) {
		if (err.code() == ErrorCode::MigrationFailed) {
			TIMDB_LOG_ERROR("Schema migration failed",
							{log::string_field("path", db_path), log::string_field("error", err.what())});
		}
		throw;
	}

	if (database->m_created) {
		TIMDB_LOG_INFO("Created database", {log::string_field("path", db_path)});
	}
	import::import_if_needed(*database, parent_directory(db_path));

	return database;
}

void Database::connect() {
	std::string parent = parent_directory(m_path);
	auto rp = Context::mkdir_and_parents_if_needed(parent);
	if (!rp.first) {
		throw Error(ErrorCode::StorageUnavailable, "Unable to create database directory " + parent + ": " + rp.second);
	}

	struct stat st;
	m_created = stat(m_path.c_str(), &st) != 0;

	try {
		m_storage = std::make_unique<Storage>(create_storage(m_path));
		m_storage->on_open = [this](sqlite3 *handle) { m_db = handle; };
		m_storage->open_forever();
	} catch (const std::system_error &err) {
		throw Error(ErrorCode::StorageUnavailable, "Unable to open database " + m_path + ": " + err.what());
	}

	if (!m_db) {
		throw Error(ErrorCode::StorageUnavailable, "Unable to open database " + m_path);
	}

	try {
		apply_pragmas();
	} catch (const Error &err) {
		// A busy database is still a usable one; anything else means the file is not ours to use
		if (err.code() == ErrorCode::Busy) {
			throw;
		}
		throw Error(ErrorCode::StorageUnavailable, "Unable to configure database " + m_path + ": " + err.what());
	}
}

void Database::apply_pragmas() {
	// Wait for locks instead of failing immediately. Set first so the
	// journal_mode switch below also waits.
	int rc = sqlite3_busy_timeout(m_db, *timdb_db_timeout);
	if (rc != SQLITE_OK) {
		throw error_from_sqlite(m_db, rc, "Failed to set busy timeout");
	}

	// WAL enables concurrent readers while a writer holds the lock
	exec(m_db, "PRAGMA journal_mode=WAL");

	// NORMAL is durable enough under WAL
	exec(m_db, "PRAGMA synchronous=NORMAL");

	// foreign keys are OFF by default in sqlite
	exec(m_db, "PRAGMA foreign_keys=ON");
}

// Transaction implementation

Transaction::Transaction(Database &db, Type type) : m_db(db), m_lock(db.mutex()) {
	if (sqlite3_get_autocommit(m_db.get()) == 0) {
		// Already inside a transaction on this connection; join it
		return;
	}

	const char *txn_cmd = nullptr;
	switch (type) {
		case Type::Deferred:
			txn_cmd = "BEGIN DEFERRED";
			break;
		case Type::Immediate:
			txn_cmd = "BEGIN IMMEDIATE";
			break;
		case Type::Exclusive:
			txn_cmd = "BEGIN EXCLUSIVE";
			break;
	}

	int rc = sqlite3_exec(m_db.get(), txn_cmd, nullptr, nullptr, nullptr);
	if (rc != SQLITE_OK) {
		throw error_from_sqlite(m_db.get(), rc, "Failed to begin transaction");
	}
	m_owner = true;
}

Transaction::~Transaction() {
	rollback();
}

void Transaction::commit() {
	if (!m_owner || m_finished) {
		return;
	}

	int rc = sqlite3_exec(m_db.get(), "COMMIT", nullptr, nullptr, nullptr);
	if (rc != SQLITE_OK) {
		throw error_from_sqlite(m_db.get(), rc, "Failed to commit");
	}
	m_finished = true;
}

void Transaction::rollback() {
	if (m_owner && !m_finished) {
		sqlite3_exec(m_db.get(), "ROLLBACK", nullptr, nullptr, nullptr);
		m_finished = true; // Prevent double-rollback in destructor
	}
}

// StorageManager implementation

std::pair<bool, std::string> StorageManager::get_config_root() {
	std::string configured_home = Context::get_tim_home();
	if (!configured_home.empty()) {
		return std::make_pair(true, configured_home);
	}

	const char *root_env = getenv("TIM_CONFIG_ROOT");
	if (root_env && *root_env) {
		return std::make_pair(true, std::string(root_env));
	}

	const char *xdg_env = getenv("XDG_CONFIG_HOME");
	if (xdg_env && *xdg_env) {
		return std::make_pair(true, std::string(xdg_env) + "/tim");
	}

	std::string home_dir;
	const char *home_env = getenv("HOME");
	if (home_env && *home_env) {
		home_dir = home_env;
	} else {
		auto bufsize = sysconf(_SC_GETPW_R_SIZE_MAX);
		bufsize = (bufsize == -1) ? 16384 : bufsize;

		std::unique_ptr<char[]> buf(new char[bufsize]);

		struct passwd pwd, *result = NULL;
		getpwuid_r(geteuid(), &pwd, buf.get(), bufsize, &result);
		if (result && result->pw_dir) {
			home_dir = result->pw_dir;
		}
	}

	if (home_dir.empty()) {
		return std::make_pair(false, "Could not determine the home directory");
	}

	return std::make_pair(true, home_dir + "/.config/tim");
}

std::pair<bool, std::string> StorageManager::get_db_path() {
	auto root = get_config_root();
	if (!root.first) {
		return root;
	}

	auto rp = Context::mkdir_and_parents_if_needed(root.second);
	if (!rp.first) {
		return std::make_pair(false, "Unable to create directory " + root.second + ": " + rp.second);
	}

	return std::make_pair(true, root.second + "/tim.db");
}

Database &StorageManager::shared() {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (!m_database) {
		std::string db_path = m_path_override;
		if (db_path.empty()) {
			auto db_path_result = get_db_path();
			if (!db_path_result.first) {
				throw Error(ErrorCode::StorageUnavailable, "Failed to get database path: " + db_path_result.second);
			}
			db_path = db_path_result.second;
		}

		m_database = Database::open(db_path);
	}

	return *m_database;
}

void StorageManager::reset() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_database.reset();
}

void StorageManager::reset_for_testing(const std::string &db_path) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_database.reset();
	m_path_override = db_path;
}

} // namespace db
} // namespace timdb

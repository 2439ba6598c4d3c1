/**
 * Database layer for timdb using sqlite_orm
 *
 * This header centralizes all SQLite/ORM logic to keep database operations
 * separate from the repository logic. The schema itself is owned by the
 * versioned SQL migrations; the ORM mapping below mirrors it for reads.
 */

#ifndef TIMDB_DB_H
#define TIMDB_DB_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace timdb {

/**
 * Error categories surfaced by the storage layer.
 * Lookups that miss are not errors; they return an empty optional.
 */
enum class ErrorCode {
	StorageUnavailable,	 // file cannot be created/opened
	MigrationFailed,	 // a schema script failed, nothing was applied
	Busy,				 // busy timeout exhausted while waiting for the write lock
	ConstraintViolation, // uniqueness or foreign key violation (caller bug)
	AlreadyLocked,		 // workspace lock held by a live holder
	InvalidArgument,
	StorageError
};

const char *error_code_name(ErrorCode code);

class Error : public std::runtime_error {
  public:
	Error(ErrorCode code, const std::string &message) : std::runtime_error(message), m_code(code) {}

	ErrorCode code() const {
		return m_code;
	}

  private:
	ErrorCode m_code;
};

namespace db {

/**
 * Translate an SQLite result code into an Error.
 * @param db Connection the code came from (may be nullptr)
 * @param rc SQLite result code
 * @param context Short description of the failed operation
 */
Error error_from_sqlite(sqlite3 *db, int rc, const std::string &context);

/**
 * Translate the std::system_error thrown by sqlite_orm into an Error.
 */
Error error_from_system_error(const std::system_error &err);

/**
 * RAII guard for SQLite prepared statements.
 * Automatically finalizes the statement when destroyed.
 */
class StmtGuard {
  public:
	explicit StmtGuard(sqlite3_stmt *stmt) : m_stmt(stmt) {}

	// Non-copyable
	StmtGuard(const StmtGuard &) = delete;
	StmtGuard &operator=(const StmtGuard &) = delete;

	// Movable
	StmtGuard(StmtGuard &&other) noexcept : m_stmt(other.m_stmt) {
		other.m_stmt = nullptr;
	}
	StmtGuard &operator=(StmtGuard &&other) noexcept {
		if (this != &other) {
			if (m_stmt)
				sqlite3_finalize(m_stmt);
			m_stmt = other.m_stmt;
			other.m_stmt = nullptr;
		}
		return *this;
	}

	~StmtGuard() {
		if (m_stmt)
			sqlite3_finalize(m_stmt);
	}

	sqlite3_stmt *get() const {
		return m_stmt;
	}

  private:
	sqlite3_stmt *m_stmt = nullptr;
};

/**
 * Raw SQL helpers. All of them throw Error on failure.
 */
StmtGuard prepare(sqlite3 *db, const std::string &query);
void exec(sqlite3 *db, const std::string &sql);

void bind_text(sqlite3_stmt *stmt, int pos, const std::string &value);
void bind_optional_text(sqlite3_stmt *stmt, int pos, const std::optional<std::string> &value);
void bind_int64(sqlite3_stmt *stmt, int pos, int64_t value);
void bind_optional_int64(sqlite3_stmt *stmt, int pos, const std::optional<int64_t> &value);

/**
 * Step a statement.
 * @return true if a row is available, false when the statement is done
 */
bool step(sqlite3_stmt *stmt);

std::string column_text(sqlite3_stmt *stmt, int col);
std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, int col);
int64_t column_int64(sqlite3_stmt *stmt, int col);
std::optional<int64_t> column_optional_int64(sqlite3_stmt *stmt, int col);

/**
 * ORM model structs that map directly to database tables.
 * Optional members are nullable columns.
 */

struct SchemaVersion {
	int id;
	int version;
	int import_completed; // SQLite doesn't have native bool, stored as int
};

struct Project {
	int64_t id;
	std::string repository_id;
	std::optional<std::string> remote_url;
	std::optional<std::string> last_git_root;
	std::optional<std::string> external_config_path;
	std::optional<std::string> external_tasks_dir;
	std::optional<std::string> remote_label;
	int64_t highest_plan_id;
	std::string created_at;
	std::string updated_at;
};

struct Workspace {
	int64_t id;
	int64_t project_id;
	std::optional<std::string> task_id;
	std::string workspace_path;
	std::optional<std::string> original_plan_file_path;
	std::optional<std::string> branch;
	std::optional<std::string> name;
	std::optional<std::string> description;
	std::optional<std::string> plan_id;
	std::optional<std::string> plan_title;
	std::string created_at;
	std::string updated_at;
};

struct WorkspaceIssue {
	int64_t id;
	int64_t workspace_id;
	std::string issue_url;
};

struct WorkspaceLock {
	int64_t workspace_id;
	std::string lock_type; // "persistent" or "pid"
	std::optional<int64_t> pid;
	std::string started_at;
	std::string hostname;
	std::string command;
};

struct Permission {
	int64_t id;
	int64_t project_id;
	std::string permission_type; // "allow" or "deny"
	std::string pattern;
};

struct Assignment {
	int64_t id;
	int64_t project_id;
	std::string plan_uuid;
	std::optional<int64_t> plan_id;
	std::optional<int64_t> workspace_id;
	std::optional<std::string> claimed_by_user;
	std::optional<std::string> status;
	std::string assigned_at;
	std::string updated_at;

	// Joined from workspace.workspace_path on reads, not a column
	std::optional<std::string> workspace_path;
};

/**
 * Creates the sqlite_orm storage definition.
 * This defines the mapping between C++ structs and SQLite tables. The
 * tables themselves are created by the SQL migrations, so sync_schema()
 * is never called on this storage.
 */
inline auto create_storage(const std::string &db_path) {
	using namespace sqlite_orm;

	return sqlite_orm::make_storage(
		db_path,
		make_table("schema_version", make_column("id", &SchemaVersion::id, primary_key()),
				   make_column("version", &SchemaVersion::version),
				   make_column("import_completed", &SchemaVersion::import_completed)),
		make_table("project", make_column("id", &Project::id, primary_key()),
				   make_column("repository_id", &Project::repository_id, unique()),
				   make_column("remote_url", &Project::remote_url),
				   make_column("last_git_root", &Project::last_git_root),
				   make_column("external_config_path", &Project::external_config_path),
				   make_column("external_tasks_dir", &Project::external_tasks_dir),
				   make_column("remote_label", &Project::remote_label),
				   make_column("highest_plan_id", &Project::highest_plan_id),
				   make_column("created_at", &Project::created_at), make_column("updated_at", &Project::updated_at)),
		make_table("workspace", make_column("id", &Workspace::id, primary_key()),
				   make_column("project_id", &Workspace::project_id), make_column("task_id", &Workspace::task_id),
				   make_column("workspace_path", &Workspace::workspace_path, unique()),
				   make_column("original_plan_file_path", &Workspace::original_plan_file_path),
				   make_column("branch", &Workspace::branch), make_column("name", &Workspace::name),
				   make_column("description", &Workspace::description), make_column("plan_id", &Workspace::plan_id),
				   make_column("plan_title", &Workspace::plan_title),
				   make_column("created_at", &Workspace::created_at),
				   make_column("updated_at", &Workspace::updated_at),
				   foreign_key(&Workspace::project_id).references(&Project::id).on_delete.cascade()),
		make_table("workspace_issue", make_column("id", &WorkspaceIssue::id, primary_key()),
				   make_column("workspace_id", &WorkspaceIssue::workspace_id),
				   make_column("issue_url", &WorkspaceIssue::issue_url),
				   foreign_key(&WorkspaceIssue::workspace_id).references(&Workspace::id).on_delete.cascade()),
		make_table("workspace_lock", make_column("workspace_id", &WorkspaceLock::workspace_id, primary_key()),
				   make_column("lock_type", &WorkspaceLock::lock_type), make_column("pid", &WorkspaceLock::pid),
				   make_column("started_at", &WorkspaceLock::started_at),
				   make_column("hostname", &WorkspaceLock::hostname),
				   make_column("command", &WorkspaceLock::command),
				   foreign_key(&WorkspaceLock::workspace_id).references(&Workspace::id).on_delete.cascade()),
		make_table("permission", make_column("id", &Permission::id, primary_key()),
				   make_column("project_id", &Permission::project_id),
				   make_column("permission_type", &Permission::permission_type),
				   make_column("pattern", &Permission::pattern),
				   foreign_key(&Permission::project_id).references(&Project::id).on_delete.cascade()),
		make_table("assignment", make_column("id", &Assignment::id, primary_key()),
				   make_column("project_id", &Assignment::project_id),
				   make_column("plan_uuid", &Assignment::plan_uuid), make_column("plan_id", &Assignment::plan_id),
				   make_column("workspace_id", &Assignment::workspace_id),
				   make_column("claimed_by_user", &Assignment::claimed_by_user),
				   make_column("status", &Assignment::status), make_column("assigned_at", &Assignment::assigned_at),
				   make_column("updated_at", &Assignment::updated_at),
				   foreign_key(&Assignment::project_id).references(&Project::id).on_delete.cascade(),
				   foreign_key(&Assignment::workspace_id).references(&Workspace::id).on_delete.set_null()));
}

// Type alias for the storage type
using Storage = decltype(create_storage(""));

/**
 * A versioned schema script. Scripts are applied in ascending version order.
 */
struct Migration {
	int version;
	std::string sql;
};

/**
 * The ordered list of migrations that make up the current schema.
 */
const std::vector<Migration> &schema_migrations();

/**
 * Bring the schema up to date.
 *
 * Creates the one-row schema_version table at version 0 if it is absent,
 * then applies every migration newer than the stored version. The version
 * read, all scripts and the version bump run in one immediate transaction,
 * so a failing script leaves the database exactly as it was.
 *
 * @param db Open connection
 * @param migrations Ordered migration list
 * @throws Error(MigrationFailed) if any script fails or the stored version
 *         is newer than the newest known migration
 */
void run_migrations(sqlite3 *db, const std::vector<Migration> &migrations);

/**
 * Read the stored schema version (0 if the version table is missing).
 */
int current_schema_version(sqlite3 *db);

/**
 * An open database: one SQLite connection, the ORM storage sharing it and
 * the mutex that serializes its use within the process.
 */
class Database {
  public:
	/**
	 * Open or create the database at db_path, apply connection pragmas and
	 * migrations, and run the legacy JSON import unless it has completed.
	 * @throws Error(StorageUnavailable) or Error(MigrationFailed)
	 */
	static std::unique_ptr<Database> open(const std::string &db_path);

	// Non-copyable
	Database(const Database &) = delete;
	Database &operator=(const Database &) = delete;

	~Database();

	Storage &storage() {
		return *m_storage;
	}

	/**
	 * Get the raw sqlite3 handle shared with the ORM storage.
	 */
	sqlite3 *get() const {
		return m_db;
	}

	const std::string &path() const {
		return m_path;
	}

	/**
	 * Whether the database file was created by open().
	 */
	bool created() const {
		return m_created;
	}

	std::recursive_mutex &mutex() {
		return m_mutex;
	}

  private:
	explicit Database(const std::string &db_path);

	void connect();
	void apply_pragmas();

	std::string m_path;
	std::unique_ptr<Storage> m_storage;
	sqlite3 *m_db = nullptr;
	bool m_created = false;
	std::recursive_mutex m_mutex;
};

/**
 * RAII transaction on a Database.
 *
 * Holds the database mutex for its lifetime. If the connection is already
 * inside a transaction (a caller up the stack opened one), the new object
 * joins it: commit() and rollback() are then left to the outermost owner.
 * Uncommitted transactions are rolled back on destruction.
 */
class Transaction {
  public:
	enum class Type { Deferred, Immediate, Exclusive };

	/**
	 * Begin a transaction.
	 * @throws Error(Busy) if the write lock could not be taken within the busy timeout
	 */
	explicit Transaction(Database &db, Type type = Type::Immediate);

	// Non-copyable
	Transaction(const Transaction &) = delete;
	Transaction &operator=(const Transaction &) = delete;

	~Transaction();

	sqlite3 *get() const {
		return m_db.get();
	}

	Storage &storage() {
		return m_db.storage();
	}

	/**
	 * Commit the transaction (no-op when joined to an outer one).
	 * @throws Error on failure; the destructor then rolls back
	 */
	void commit();

	/**
	 * Rollback the transaction (if this object started it).
	 */
	void rollback();

  private:
	Database &m_db;
	std::unique_lock<std::recursive_mutex> m_lock;
	bool m_owner = false;
	bool m_finished = false;
};

/**
 * Run fn with the database mutex held, translating sqlite_orm exceptions.
 */
template <typename F> auto with_lock(Database &db, F &&fn) -> decltype(fn()) {
	std::lock_guard<std::recursive_mutex> lock(db.mutex());
	try {
		return fn();
	} catch (const std::system_error &err) {
		throw error_from_system_error(err);
	}
}

/**
 * Storage manager that provides lazy-initialized, process-wide access to
 * the database. The handle is created on first access and can be reset
 * when the database path changes (e.g., during testing).
 */
class StorageManager {
  public:
	/**
	 * Get the shared database. Initializes if needed; concurrent first
	 * callers block until a single initialization has finished.
	 * @throws Error(StorageUnavailable) or Error(MigrationFailed)
	 */
	static Database &shared();

	/**
	 * Resolve the configuration root directory.
	 * Order: configured tim home, TIM_CONFIG_ROOT, $XDG_CONFIG_HOME/tim,
	 * $HOME/.config/tim.
	 * @return Pair of (success, path_or_error_message)
	 */
	static std::pair<bool, std::string> get_config_root();

	/**
	 * Get the database file path, creating directories if needed.
	 * @return Pair of (success, path_or_error_message)
	 */
	static std::pair<bool, std::string> get_db_path();

	/**
	 * Drop the shared handle; the next shared() re-resolves the path.
	 */
	static void reset();

	/**
	 * Drop the shared handle and pin the next shared() to db_path.
	 * An empty path removes the pin.
	 */
	static void reset_for_testing(const std::string &db_path);

  private:
	static std::unique_ptr<Database> m_database;
	static std::string m_path_override;
	static std::mutex m_mutex;
};

} // namespace db
} // namespace timdb

#endif // TIMDB_DB_H

/**
 * Workspace lock repository.
 *
 * The lock table holds at most one row per workspace. Acquisition and
 * stale reclamation happen inside one immediate transaction, so two
 * processes racing for the same workspace serialize on SQLite's write
 * lock and exactly one of them wins.
 */

#include "timdb_db.h"
#include "timdb_internal.h"
#include "timdb_log.h"

#include <cerrno>
#include <climits>
#include <signal.h>
#include <unistd.h>

namespace timdb {

namespace {

const char *LOCK_SELECT = "SELECT workspace_id, lock_type, pid, started_at, hostname, command FROM workspace_lock ";

WorkspaceLock read_lock(sqlite3_stmt *stmt) {
	WorkspaceLock lock;
	lock.workspace_id = db::column_int64(stmt, 0);
	lock.lock_type = db::column_text(stmt, 1);
	lock.pid = db::column_optional_int64(stmt, 2);
	lock.started_at = db::column_text(stmt, 3);
	lock.hostname = db::column_text(stmt, 4);
	lock.command = db::column_text(stmt, 5);
	return lock;
}

std::string local_hostname() {
	char buf[HOST_NAME_MAX + 1];
	if (gethostname(buf, sizeof(buf)) != 0) {
		return "unknown";
	}
	buf[HOST_NAME_MAX] = '\0';
	return buf;
}

std::string describe(const WorkspaceLock &lock) {
	std::string description = lock.lock_type + " lock";
	if (lock.pid) {
		description += " held by pid " + std::to_string(*lock.pid);
	}
	description += " on " + lock.hostname + " since " + lock.started_at;
	if (!lock.command.empty()) {
		description += " (" + lock.command + ")";
	}
	return description;
}

/**
 * Delete exactly the lock row that was inspected. A lock re-acquired by
 * someone else in the meantime has a different pid or start time and
 * survives.
 */
bool delete_specific(sqlite3 *db, const WorkspaceLock &lock) {
	auto stmt = db::prepare(db, "DELETE FROM workspace_lock WHERE workspace_id = ? AND pid IS ? AND started_at = ?");
	db::bind_int64(stmt.get(), 1, lock.workspace_id);
	db::bind_optional_int64(stmt.get(), 2, lock.pid);
	db::bind_text(stmt.get(), 3, lock.started_at);
	db::step(stmt.get());
	return sqlite3_changes(db) > 0;
}

} // namespace

const char *lock_type_name(LockType type) {
	return type == LockType::Persistent ? "persistent" : "pid";
}

std::optional<LockType> parse_lock_type(const std::string &name) {
	if (name == "persistent") {
		return LockType::Persistent;
	}
	if (name == "pid") {
		return LockType::Pid;
	}
	return std::nullopt;
}

bool WorkspaceLocks::is_process_alive(int64_t pid) {
	if (pid <= 0 || pid > INT_MAX) {
		return false;
	}
	if (kill(static_cast<pid_t>(pid), 0) == 0) {
		return true;
	}
	// EPERM: the process exists but belongs to someone else
	return errno == EPERM;
}

bool WorkspaceLocks::is_stale(const WorkspaceLock &lock, int64_t now) {
	if (lock.lock_type != "pid") {
		return false;
	}

	auto started = parse_iso8601_ms(lock.started_at);
	if (!started) {
		return true;
	}
	if (now - *started > STALE_LOCK_TIMEOUT_MS) {
		return true;
	}

	return !lock.pid || !is_process_alive(*lock.pid);
}

bool WorkspaceLocks::reclaim_if_stale(db::Database &db, const WorkspaceLock &lock) {
	if (!is_stale(lock, now_ms())) {
		return false;
	}

	db::Transaction txn(db);
	bool removed = delete_specific(txn.get(), lock);
	txn.commit();

	if (removed) {
		TIMDB_LOG_INFO("Reclaimed stale workspace lock",
					   {log::int_field("workspace_id", lock.workspace_id), log::string_field("lock", describe(lock))});
	}
	return removed;
}

WorkspaceLock WorkspaceLocks::acquire(db::Database &db, int64_t workspace_id, const LockRequest &request) {
	db::Transaction txn(db);

	auto existing = inspect_including_stale(db, workspace_id);
	if (existing) {
		if (!is_stale(*existing, now_ms())) {
			throw Error(ErrorCode::AlreadyLocked,
						"Workspace " + std::to_string(workspace_id) + " is already locked: " + describe(*existing));
		}
		delete_specific(txn.get(), *existing);
		TIMDB_LOG_INFO("Reclaimed stale workspace lock", {log::int_field("workspace_id", workspace_id),
														  log::string_field("lock", describe(*existing))});
	}

	WorkspaceLock lock;
	{
		auto stmt = db::prepare(txn.get(), "INSERT INTO workspace_lock (workspace_id, lock_type, pid, hostname, command) "
										   "VALUES (?, ?, ?, ?, ?) "
										   "RETURNING workspace_id, lock_type, pid, started_at, hostname, command");
		db::bind_int64(stmt.get(), 1, workspace_id);
		db::bind_text(stmt.get(), 2, lock_type_name(request.type));
		db::bind_int64(stmt.get(), 3, request.pid ? *request.pid : static_cast<int64_t>(getpid()));
		db::bind_text(stmt.get(), 4, request.hostname ? *request.hostname : local_hostname());
		db::bind_text(stmt.get(), 5,
					  request.owner ? request.command + " (owner: " + *request.owner + ")" : request.command);
		if (!db::step(stmt.get())) {
			throw Error(ErrorCode::StorageError, "Acquiring lock on workspace " + std::to_string(workspace_id) +
													 " returned no row");
		}
		lock = read_lock(stmt.get());
		db::step(stmt.get());
	}

	txn.commit();
	TIMDB_LOG_DEBUG("Acquired workspace lock",
					{log::int_field("workspace_id", workspace_id), log::string_field("lock", describe(lock))});
	return lock;
}

bool WorkspaceLocks::release(db::Database &db, int64_t workspace_id, const ReleaseOptions &options) {
	db::Transaction txn(db);

	auto existing = inspect_including_stale(db, workspace_id);
	if (!existing) {
		return false;
	}

	if (!options.force) {
		if (existing->lock_type != "pid") {
			return false;
		}
		int64_t pid = options.pid ? *options.pid : static_cast<int64_t>(getpid());
		bool owned = existing->pid && *existing->pid == pid;
		if (!owned && !is_stale(*existing, now_ms())) {
			return false;
		}
	}

	bool removed;
	{
		auto stmt = db::prepare(txn.get(), "DELETE FROM workspace_lock WHERE workspace_id = ?");
		db::bind_int64(stmt.get(), 1, workspace_id);
		db::step(stmt.get());
		removed = sqlite3_changes(txn.get()) > 0;
	}

	txn.commit();
	return removed;
}

std::optional<WorkspaceLock> WorkspaceLocks::inspect(db::Database &db, int64_t workspace_id) {
	auto existing = inspect_including_stale(db, workspace_id);
	if (!existing) {
		return std::nullopt;
	}

	if (reclaim_if_stale(db, *existing)) {
		return std::nullopt;
	}

	// Re-read: the row may have changed between the check and now
	auto current = inspect_including_stale(db, workspace_id);
	if (current && is_stale(*current, now_ms())) {
		return std::nullopt;
	}
	return current;
}

std::optional<WorkspaceLock> WorkspaceLocks::inspect_including_stale(db::Database &db, int64_t workspace_id) {
	std::lock_guard<std::recursive_mutex> guard(db.mutex());
	auto stmt = db::prepare(db.get(), std::string(LOCK_SELECT) + "WHERE workspace_id = ?");
	db::bind_int64(stmt.get(), 1, workspace_id);
	if (!db::step(stmt.get())) {
		return std::nullopt;
	}
	return read_lock(stmt.get());
}

bool WorkspaceLocks::is_locked(db::Database &db, int64_t workspace_id) {
	return inspect(db, workspace_id).has_value();
}

int WorkspaceLocks::clean_stale(db::Database &db) {
	db::Transaction txn(db);

	std::vector<WorkspaceLock> locks;
	{
		auto stmt = db::prepare(txn.get(), std::string(LOCK_SELECT) + "WHERE lock_type = 'pid'");
		while (db::step(stmt.get())) {
			locks.push_back(read_lock(stmt.get()));
		}
	}

	int removed = 0;
	int64_t now = now_ms();
	for (const auto &lock : locks) {
		if (is_stale(lock, now) && delete_specific(txn.get(), lock)) {
			++removed;
		}
	}

	txn.commit();

	if (removed > 0) {
		TIMDB_LOG_INFO("Removed stale workspace locks", {log::int_field("count", removed)});
	}
	return removed;
}

} // namespace timdb

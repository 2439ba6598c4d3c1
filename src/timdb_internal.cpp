#include "timdb_internal.h"

#include "timdb_db.h"
#include "timdb_log.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <sstream>
#include <sys/stat.h>

using namespace sqlite_orm;

namespace timdb {

namespace {

const char *SQL_NOW = "strftime('%Y-%m-%dT%H:%M:%fZ', 'now')";

const char *ASSIGNMENT_SELECT = "SELECT a.id, a.project_id, a.plan_uuid, a.plan_id, a.workspace_id, "
								"a.claimed_by_user, a.status, a.assigned_at, a.updated_at, w.workspace_path "
								"FROM assignment a LEFT JOIN workspace w ON w.id = a.workspace_id ";

/**
 * Collects "column = ?" clauses for a partial update. An empty string
 * value is stored as NULL.
 */
class UpdateBuilder {
  public:
	void add(const char *column, const std::optional<std::string> &value) {
		if (!value) {
			return;
		}
		m_columns.push_back(column);
		if (value->empty()) {
			m_values.push_back(std::nullopt);
		} else {
			m_values.push_back(value);
		}
	}

	/**
	 * Build "UPDATE table SET a = ?, ..., updated_at = now WHERE where_clause".
	 */
	std::string sql(const std::string &table, const std::string &where_clause) const {
		std::string query = "UPDATE " + table + " SET ";
		for (const auto &column : m_columns) {
			query += column + " = ?, ";
		}
		query += "updated_at = " + std::string(SQL_NOW) + " WHERE " + where_clause;
		return query;
	}

	/**
	 * Bind the collected values starting at position 1.
	 * @return The next free bind position
	 */
	int bind(sqlite3_stmt *stmt) const {
		int pos = 1;
		for (const auto &value : m_values) {
			db::bind_optional_text(stmt, pos++, value);
		}
		return pos;
	}

  private:
	std::vector<std::string> m_columns;
	std::vector<std::optional<std::string>> m_values;
};

Assignment read_assignment(sqlite3_stmt *stmt) {
	Assignment row;
	row.id = db::column_int64(stmt, 0);
	row.project_id = db::column_int64(stmt, 1);
	row.plan_uuid = db::column_text(stmt, 2);
	row.plan_id = db::column_optional_int64(stmt, 3);
	row.workspace_id = db::column_optional_int64(stmt, 4);
	row.claimed_by_user = db::column_optional_text(stmt, 5);
	row.status = db::column_optional_text(stmt, 6);
	row.assigned_at = db::column_text(stmt, 7);
	row.updated_at = db::column_text(stmt, 8);
	row.workspace_path = db::column_optional_text(stmt, 9);
	return row;
}

} // namespace

int64_t now_ms() {
	auto now = std::chrono::system_clock::now();
	return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::optional<int64_t> parse_iso8601_ms(const std::string &timestamp) {
	struct tm tm_val;
	memset(&tm_val, 0, sizeof(tm_val));

	int year, month, day, hour, minute, second;
	char separator;
	int consumed = 0;
	if (sscanf(timestamp.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &separator, &hour, &minute,
			   &second, &consumed) != 7) {
		return std::nullopt;
	}
	if (separator != 'T' && separator != 't' && separator != ' ') {
		return std::nullopt;
	}
	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
		return std::nullopt;
	}

	size_t pos = consumed;
	int64_t millis = 0;
	if (pos < timestamp.size() && timestamp[pos] == '.') {
		++pos;
		int digits = 0;
		while (pos < timestamp.size() && isdigit(static_cast<unsigned char>(timestamp[pos]))) {
			// Anything past milliseconds is truncated
			if (digits < 3) {
				millis = millis * 10 + (timestamp[pos] - '0');
			}
			++digits;
			++pos;
		}
		if (digits == 0) {
			return std::nullopt;
		}
		for (; digits < 3; ++digits) {
			millis *= 10;
		}
	}

	int64_t offset_seconds = 0;
	if (pos < timestamp.size()) {
		char zone = timestamp[pos];
		if ((zone == 'Z' || zone == 'z') && pos + 1 == timestamp.size()) {
			// UTC
		} else if (zone == '+' || zone == '-') {
			int offset_hours, offset_minutes;
			if (sscanf(timestamp.c_str() + pos + 1, "%2d:%2d", &offset_hours, &offset_minutes) != 2 ||
				timestamp.size() != pos + 6) {
				return std::nullopt;
			}
			offset_seconds = (offset_hours * 3600 + offset_minutes * 60) * (zone == '+' ? 1 : -1);
		} else {
			return std::nullopt;
		}
	}

	tm_val.tm_year = year - 1900;
	tm_val.tm_mon = month - 1;
	tm_val.tm_mday = day;
	tm_val.tm_hour = hour;
	tm_val.tm_min = minute;
	tm_val.tm_sec = second;
	time_t seconds = timegm(&tm_val);

	return (static_cast<int64_t>(seconds) - offset_seconds) * 1000 + millis;
}

// Projects

Project Projects::get_or_create(db::Database &db, const std::string &repository_id, const ProjectDetails &details) {
	db::Transaction txn(db);

	{
		// The unique constraint turns a racing insert into a no-op; the re-read
		// below then returns the winner's row.
		auto stmt = db::prepare(txn.get(), "INSERT INTO project (repository_id, remote_url, last_git_root, "
										   "external_config_path, external_tasks_dir, remote_label) "
										   "VALUES (?, ?, ?, ?, ?, ?) ON CONFLICT(repository_id) DO NOTHING");
		db::bind_text(stmt.get(), 1, repository_id);
		db::bind_optional_text(stmt.get(), 2, details.remote_url);
		db::bind_optional_text(stmt.get(), 3, details.last_git_root);
		db::bind_optional_text(stmt.get(), 4, details.external_config_path);
		db::bind_optional_text(stmt.get(), 5, details.external_tasks_dir);
		db::bind_optional_text(stmt.get(), 6, details.remote_label);
		db::step(stmt.get());

		if (sqlite3_changes(txn.get()) > 0) {
			TIMDB_LOG_DEBUG("Created project", {log::string_field("repository_id", repository_id)});
		}
	}

	auto project = get(db, repository_id);
	if (!project) {
		throw Error(ErrorCode::StorageError, "Project " + repository_id + " vanished after creation");
	}

	txn.commit();
	return *project;
}

std::optional<Project> Projects::get(db::Database &db, const std::string &repository_id) {
	return db::with_lock(db, [&]() -> std::optional<Project> {
		auto rows = db.storage().get_all<Project>(where(c(&Project::repository_id) == repository_id));
		if (rows.empty()) {
			return std::nullopt;
		}
		return rows.front();
	});
}

std::optional<Project> Projects::get_by_id(db::Database &db, int64_t project_id) {
	return db::with_lock(db, [&]() -> std::optional<Project> {
		auto ptr = db.storage().get_pointer<Project>(project_id);
		if (!ptr) {
			return std::nullopt;
		}
		return *ptr;
	});
}

bool Projects::update(db::Database &db, int64_t project_id, const ProjectUpdate &fields) {
	UpdateBuilder builder;
	builder.add("remote_url", fields.remote_url);
	builder.add("last_git_root", fields.last_git_root);
	builder.add("external_config_path", fields.external_config_path);
	builder.add("external_tasks_dir", fields.external_tasks_dir);
	builder.add("remote_label", fields.remote_label);

	db::Transaction txn(db);
	auto stmt = db::prepare(txn.get(), builder.sql("project", "id = ?"));
	int pos = builder.bind(stmt.get());
	db::bind_int64(stmt.get(), pos, project_id);
	db::step(stmt.get());
	bool matched = sqlite3_changes(txn.get()) > 0;
	txn.commit();

	return matched;
}

std::pair<int64_t, int64_t> Projects::reserve_next_plan_id(db::Database &db, const std::string &repository_id,
														   int64_t local_max_observed, int64_t count) {
	if (count < 1) {
		throw Error(ErrorCode::InvalidArgument, "Plan id reservation count must be at least 1, received " +
													std::to_string(count));
	}
	if (local_max_observed < 0) {
		throw Error(ErrorCode::InvalidArgument,
					"Observed plan id must be non-negative, received " + std::to_string(local_max_observed));
	}

	db::Transaction txn(db);
	get_or_create(db, repository_id);

	int64_t last;
	{
		// Read, compute and write in one statement under the write lock. The
		// block must end at or below INT64_MAX or SQLite would store a REAL.
		auto stmt = db::prepare(txn.get(), "UPDATE project SET highest_plan_id = max(highest_plan_id, ?) + ?, "
										   "updated_at = " +
											   std::string(SQL_NOW) +
											   " WHERE repository_id = ? AND max(highest_plan_id, ?) <= "
											   "9223372036854775807 - ? RETURNING highest_plan_id");
		db::bind_int64(stmt.get(), 1, local_max_observed);
		db::bind_int64(stmt.get(), 2, count);
		db::bind_text(stmt.get(), 3, repository_id);
		db::bind_int64(stmt.get(), 4, local_max_observed);
		db::bind_int64(stmt.get(), 5, count);
		if (!db::step(stmt.get())) {
			// The project exists inside this transaction, so only the guard can reject
			throw Error(ErrorCode::InvalidArgument, "Reserving " + std::to_string(count) + " plan ids for " +
														repository_id + " would exceed the largest plan id");
		}
		last = db::column_int64(stmt.get(), 0);
		db::step(stmt.get());
	}

	txn.commit();
	return std::make_pair(last - count + 1, last);
}

void Projects::raise_highest_plan_id(db::Database &db, int64_t project_id, int64_t value) {
	db::Transaction txn(db);
	auto stmt = db::prepare(txn.get(), "UPDATE project SET highest_plan_id = max(highest_plan_id, ?), updated_at = " +
										   std::string(SQL_NOW) + " WHERE id = ?");
	db::bind_int64(stmt.get(), 1, value);
	db::bind_int64(stmt.get(), 2, project_id);
	db::step(stmt.get());
	txn.commit();
}

std::vector<Project> Projects::list(db::Database &db) {
	return db::with_lock(db, [&]() { return db.storage().get_all<Project>(order_by(&Project::id)); });
}

// Workspaces

Workspace Workspaces::record(db::Database &db, const WorkspaceInput &input) {
	if (input.workspace_path.empty()) {
		throw Error(ErrorCode::InvalidArgument, "A workspace path must be provided");
	}

	db::Transaction txn(db);

	int64_t workspace_id;
	{
		auto stmt = db::prepare(
			txn.get(),
			"INSERT INTO workspace (project_id, task_id, workspace_path, original_plan_file_path, branch, name, "
			"description, plan_id, plan_title) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
			"ON CONFLICT(workspace_path) DO UPDATE SET "
			"project_id = excluded.project_id, "
			"task_id = COALESCE(excluded.task_id, workspace.task_id), "
			"original_plan_file_path = COALESCE(excluded.original_plan_file_path, workspace.original_plan_file_path), "
			"branch = COALESCE(excluded.branch, workspace.branch), "
			"name = COALESCE(excluded.name, workspace.name), "
			"description = COALESCE(excluded.description, workspace.description), "
			"plan_id = COALESCE(excluded.plan_id, workspace.plan_id), "
			"plan_title = COALESCE(excluded.plan_title, workspace.plan_title), "
			"updated_at = " +
				std::string(SQL_NOW) + " RETURNING id");
		db::bind_int64(stmt.get(), 1, input.project_id);
		db::bind_optional_text(stmt.get(), 2, input.task_id);
		db::bind_text(stmt.get(), 3, input.workspace_path);
		db::bind_optional_text(stmt.get(), 4, input.original_plan_file_path);
		db::bind_optional_text(stmt.get(), 5, input.branch);
		db::bind_optional_text(stmt.get(), 6, input.name);
		db::bind_optional_text(stmt.get(), 7, input.description);
		db::bind_optional_text(stmt.get(), 8, input.plan_id);
		db::bind_optional_text(stmt.get(), 9, input.plan_title);
		if (!db::step(stmt.get())) {
			throw Error(ErrorCode::StorageError, "Recording workspace " + input.workspace_path + " returned no row");
		}
		workspace_id = db::column_int64(stmt.get(), 0);
		db::step(stmt.get());
	}

	auto workspace = get_by_id(db, workspace_id);
	if (!workspace) {
		throw Error(ErrorCode::StorageError, "Workspace " + input.workspace_path + " vanished after recording");
	}

	txn.commit();
	return *workspace;
}

std::optional<Workspace> Workspaces::get_by_path(db::Database &db, const std::string &workspace_path) {
	return db::with_lock(db, [&]() -> std::optional<Workspace> {
		auto rows = db.storage().get_all<Workspace>(where(c(&Workspace::workspace_path) == workspace_path));
		if (rows.empty()) {
			return std::nullopt;
		}
		return rows.front();
	});
}

std::optional<Workspace> Workspaces::get_by_id(db::Database &db, int64_t workspace_id) {
	return db::with_lock(db, [&]() -> std::optional<Workspace> {
		auto ptr = db.storage().get_pointer<Workspace>(workspace_id);
		if (!ptr) {
			return std::nullopt;
		}
		return *ptr;
	});
}

std::vector<Workspace> Workspaces::find_by_task_id(db::Database &db, const std::string &task_id) {
	return db::with_lock(db, [&]() {
		return db.storage().get_all<Workspace>(where(c(&Workspace::task_id) == task_id), order_by(&Workspace::id));
	});
}

std::vector<Workspace> Workspaces::find_by_project_id(db::Database &db, int64_t project_id) {
	return db::with_lock(db, [&]() {
		return db.storage().get_all<Workspace>(where(c(&Workspace::project_id) == project_id),
											   order_by(&Workspace::id));
	});
}

std::optional<Workspace> Workspaces::patch(db::Database &db, const std::string &workspace_path,
										   const WorkspacePatch &fields) {
	UpdateBuilder builder;
	builder.add("task_id", fields.task_id);
	builder.add("original_plan_file_path", fields.original_plan_file_path);
	builder.add("branch", fields.branch);
	builder.add("name", fields.name);
	builder.add("description", fields.description);
	builder.add("plan_id", fields.plan_id);
	builder.add("plan_title", fields.plan_title);

	db::Transaction txn(db);
	{
		auto stmt = db::prepare(txn.get(), builder.sql("workspace", "workspace_path = ?"));
		int pos = builder.bind(stmt.get());
		db::bind_text(stmt.get(), pos, workspace_path);
		db::step(stmt.get());
		if (sqlite3_changes(txn.get()) == 0) {
			return std::nullopt;
		}
	}

	auto workspace = get_by_path(db, workspace_path);
	txn.commit();
	return workspace;
}

bool Workspaces::remove(db::Database &db, const std::string &workspace_path) {
	db::Transaction txn(db);

	auto workspace = get_by_path(db, workspace_path);
	if (!workspace) {
		return false;
	}

	{
		// Unclaimed assignments only existed through this workspace
		auto stmt =
			db::prepare(txn.get(), "DELETE FROM assignment WHERE workspace_id = ? AND claimed_by_user IS NULL");
		db::bind_int64(stmt.get(), 1, workspace->id);
		db::step(stmt.get());
	}

	{
		// Issues and lock cascade; remaining assignments get workspace_id = NULL
		auto stmt = db::prepare(txn.get(), "DELETE FROM workspace WHERE id = ?");
		db::bind_int64(stmt.get(), 1, workspace->id);
		db::step(stmt.get());
	}

	txn.commit();
	TIMDB_LOG_DEBUG("Deleted workspace", {log::string_field("path", workspace_path)});
	return true;
}

void Workspaces::set_issues(db::Database &db, int64_t workspace_id, const std::vector<std::string> &issue_urls) {
	db::Transaction txn(db);

	db::with_lock(db, [&]() {
		db.storage().remove_all<db::WorkspaceIssue>(where(c(&db::WorkspaceIssue::workspace_id) == workspace_id));
	});

	for (const auto &url : issue_urls) {
		add_issue(db, workspace_id, url);
	}

	txn.commit();
}

void Workspaces::add_issue(db::Database &db, int64_t workspace_id, const std::string &issue_url) {
	db::Transaction txn(db);
	auto stmt = db::prepare(txn.get(), "INSERT OR IGNORE INTO workspace_issue (workspace_id, issue_url) VALUES (?, ?)");
	db::bind_int64(stmt.get(), 1, workspace_id);
	db::bind_text(stmt.get(), 2, issue_url);
	db::step(stmt.get());
	txn.commit();
}

std::vector<std::string> Workspaces::get_issues(db::Database &db, int64_t workspace_id) {
	return db::with_lock(db, [&]() {
		return db.storage().select(&db::WorkspaceIssue::issue_url,
								   where(c(&db::WorkspaceIssue::workspace_id) == workspace_id),
								   order_by(&db::WorkspaceIssue::id));
	});
}

// Permissions

const char *permission_type_name(PermissionType type) {
	return type == PermissionType::Allow ? "allow" : "deny";
}

std::optional<PermissionType> parse_permission_type(const std::string &name) {
	if (name == "allow") {
		return PermissionType::Allow;
	}
	if (name == "deny") {
		return PermissionType::Deny;
	}
	return std::nullopt;
}

PermissionSet Permissions::get(db::Database &db, int64_t project_id) {
	auto rows = db::with_lock(db, [&]() {
		return db.storage().get_all<db::Permission>(where(c(&db::Permission::project_id) == project_id),
													order_by(&db::Permission::id));
	});

	PermissionSet permissions;
	for (const auto &row : rows) {
		if (row.permission_type == "allow") {
			permissions.allow.push_back(row.pattern);
		} else {
			permissions.deny.push_back(row.pattern);
		}
	}
	return permissions;
}

bool Permissions::add(db::Database &db, int64_t project_id, PermissionType type, const std::string &pattern) {
	db::Transaction txn(db);
	auto stmt = db::prepare(
		txn.get(), "INSERT OR IGNORE INTO permission (project_id, permission_type, pattern) VALUES (?, ?, ?)");
	db::bind_int64(stmt.get(), 1, project_id);
	db::bind_text(stmt.get(), 2, permission_type_name(type));
	db::bind_text(stmt.get(), 3, pattern);
	db::step(stmt.get());
	bool inserted = sqlite3_changes(txn.get()) > 0;
	txn.commit();
	return inserted;
}

bool Permissions::remove(db::Database &db, int64_t project_id, PermissionType type, const std::string &pattern) {
	db::Transaction txn(db);
	auto stmt = db::prepare(txn.get(),
							"DELETE FROM permission WHERE project_id = ? AND permission_type = ? AND pattern = ?");
	db::bind_int64(stmt.get(), 1, project_id);
	db::bind_text(stmt.get(), 2, permission_type_name(type));
	db::bind_text(stmt.get(), 3, pattern);
	db::step(stmt.get());
	bool removed = sqlite3_changes(txn.get()) > 0;
	txn.commit();
	return removed;
}

void Permissions::replace_all(db::Database &db, int64_t project_id, const PermissionSet &permissions) {
	db::Transaction txn(db);

	db::with_lock(db, [&]() {
		db.storage().remove_all<db::Permission>(where(c(&db::Permission::project_id) == project_id));
	});

	for (const auto &pattern : permissions.allow) {
		add(db, project_id, PermissionType::Allow, pattern);
	}
	for (const auto &pattern : permissions.deny) {
		add(db, project_id, PermissionType::Deny, pattern);
	}

	txn.commit();
}

// Assignments

ClaimResult Assignments::claim(db::Database &db, int64_t project_id, const std::string &plan_uuid,
							   std::optional<int64_t> plan_id, std::optional<int64_t> workspace_id,
							   const std::optional<std::string> &user) {
	db::Transaction txn(db);

	auto existing = get(db, project_id, plan_uuid);

	{
		auto stmt = db::prepare(txn.get(), "INSERT INTO assignment (project_id, plan_uuid, plan_id, workspace_id, "
										   "claimed_by_user, status) VALUES (?, ?, ?, ?, ?, 'in_progress') "
										   "ON CONFLICT(project_id, plan_uuid) DO UPDATE SET "
										   "plan_id = excluded.plan_id, "
										   "workspace_id = excluded.workspace_id, "
										   "claimed_by_user = excluded.claimed_by_user, "
										   "status = assignment.status, "
										   "updated_at = " +
											   std::string(SQL_NOW));
		db::bind_int64(stmt.get(), 1, project_id);
		db::bind_text(stmt.get(), 2, plan_uuid);
		db::bind_optional_int64(stmt.get(), 3, plan_id);
		db::bind_optional_int64(stmt.get(), 4, workspace_id);
		db::bind_optional_text(stmt.get(), 5, user);
		db::step(stmt.get());
	}

	auto assignment = get(db, project_id, plan_uuid);
	if (!assignment) {
		throw Error(ErrorCode::StorageError, "Failed to claim assignment for project_id=" +
												 std::to_string(project_id) + ", plan_uuid=" + plan_uuid);
	}

	txn.commit();

	ClaimResult result;
	result.assignment = *assignment;
	result.created = !existing;
	result.updated_workspace = existing && existing->workspace_id != assignment->workspace_id;
	result.updated_user = existing && existing->claimed_by_user != assignment->claimed_by_user;
	return result;
}

ReleaseResult Assignments::release(db::Database &db, int64_t project_id, const std::string &plan_uuid,
								   const std::optional<std::string> &workspace_path,
								   const std::optional<std::string> &user) {
	ReleaseResult result;
	db::Transaction txn(db);

	auto existing = get(db, project_id, plan_uuid);
	if (!existing) {
		return result;
	}
	result.existed = true;

	if (!workspace_path && !user) {
		remove(db, project_id, plan_uuid);
		txn.commit();
		result.removed = true;
		result.cleared_workspace = existing->workspace_id.has_value();
		result.cleared_user = existing->claimed_by_user.has_value();
		return result;
	}

	auto next_workspace_id = existing->workspace_id;
	if (workspace_path) {
		auto matched = Workspaces::get_by_path(db, *workspace_path);
		if (matched && existing->workspace_id && matched->id == *existing->workspace_id) {
			next_workspace_id = std::nullopt;
			result.cleared_workspace = true;
		}
	}

	auto next_user = existing->claimed_by_user;
	// A path naming some other workspace means this caller is not the claimant
	bool can_clear_user = !workspace_path || result.cleared_workspace || !existing->workspace_id;
	if (can_clear_user && user && existing->claimed_by_user == user) {
		next_user = std::nullopt;
		result.cleared_user = true;
	}

	if (!result.cleared_workspace && !result.cleared_user) {
		return result;
	}

	if (!next_workspace_id && !next_user) {
		remove(db, project_id, plan_uuid);
		result.removed = true;
	} else {
		auto stmt = db::prepare(txn.get(), "UPDATE assignment SET workspace_id = ?, claimed_by_user = ?, "
										   "updated_at = " +
											   std::string(SQL_NOW) + " WHERE project_id = ? AND plan_uuid = ?");
		db::bind_optional_int64(stmt.get(), 1, next_workspace_id);
		db::bind_optional_text(stmt.get(), 2, next_user);
		db::bind_int64(stmt.get(), 3, project_id);
		db::bind_text(stmt.get(), 4, plan_uuid);
		db::step(stmt.get());
	}

	txn.commit();
	return result;
}

std::optional<Assignment> Assignments::get(db::Database &db, int64_t project_id, const std::string &plan_uuid) {
	std::lock_guard<std::recursive_mutex> lock(db.mutex());
	auto stmt = db::prepare(db.get(), std::string(ASSIGNMENT_SELECT) + "WHERE a.project_id = ? AND a.plan_uuid = ?");
	db::bind_int64(stmt.get(), 1, project_id);
	db::bind_text(stmt.get(), 2, plan_uuid);
	if (!db::step(stmt.get())) {
		return std::nullopt;
	}
	return read_assignment(stmt.get());
}

std::vector<Assignment> Assignments::list_by_project(db::Database &db, int64_t project_id) {
	std::lock_guard<std::recursive_mutex> lock(db.mutex());
	auto stmt =
		db::prepare(db.get(), std::string(ASSIGNMENT_SELECT) + "WHERE a.project_id = ? ORDER BY a.assigned_at, a.id");
	db::bind_int64(stmt.get(), 1, project_id);

	std::vector<Assignment> rows;
	while (db::step(stmt.get())) {
		rows.push_back(read_assignment(stmt.get()));
	}
	return rows;
}

bool Assignments::remove(db::Database &db, int64_t project_id, const std::string &plan_uuid) {
	db::Transaction txn(db);
	auto stmt = db::prepare(txn.get(), "DELETE FROM assignment WHERE project_id = ? AND plan_uuid = ?");
	db::bind_int64(stmt.get(), 1, project_id);
	db::bind_text(stmt.get(), 2, plan_uuid);
	db::step(stmt.get());
	bool removed = sqlite3_changes(txn.get()) > 0;
	txn.commit();
	return removed;
}

int Assignments::clean_stale(db::Database &db, int64_t project_id, int stale_days) {
	if (stale_days < 0) {
		throw Error(ErrorCode::InvalidArgument,
					"stale_days must be non-negative, received: " + std::to_string(stale_days));
	}

	db::Transaction txn(db);
	auto stmt = db::prepare(txn.get(), "DELETE FROM assignment WHERE project_id = ? "
									   "AND updated_at < strftime('%Y-%m-%dT%H:%M:%fZ', 'now', ?)");
	db::bind_int64(stmt.get(), 1, project_id);
	db::bind_text(stmt.get(), 2, "-" + std::to_string(stale_days) + " days");
	db::step(stmt.get());
	int removed = sqlite3_changes(txn.get());
	txn.commit();

	if (removed > 0) {
		TIMDB_LOG_INFO("Removed stale assignments",
					   {log::int_field("project_id", project_id), log::int_field("count", removed)});
	}
	return removed;
}

bool Assignments::import_row(db::Database &db, const Assignment &row) {
	db::Transaction txn(db);
	auto stmt = db::prepare(txn.get(), "INSERT OR IGNORE INTO assignment (project_id, plan_uuid, plan_id, "
									   "workspace_id, claimed_by_user, status, assigned_at, updated_at) "
									   "VALUES (?, ?, ?, ?, ?, ?, COALESCE(NULLIF(?, ''), " +
										   std::string(SQL_NOW) + "), COALESCE(NULLIF(?, ''), " +
										   std::string(SQL_NOW) + "))");
	db::bind_int64(stmt.get(), 1, row.project_id);
	db::bind_text(stmt.get(), 2, row.plan_uuid);
	db::bind_optional_int64(stmt.get(), 3, row.plan_id);
	db::bind_optional_int64(stmt.get(), 4, row.workspace_id);
	db::bind_optional_text(stmt.get(), 5, row.claimed_by_user);
	db::bind_optional_text(stmt.get(), 6, row.status);
	db::bind_text(stmt.get(), 7, row.assigned_at);
	db::bind_text(stmt.get(), 8, row.updated_at);
	db::step(stmt.get());
	bool inserted = sqlite3_changes(txn.get()) > 0;
	txn.commit();
	return inserted;
}

// Context

std::pair<bool, std::string> Context::set_tim_home(const std::string dir_path) {
	// Setting "" unsets the configured home
	if (dir_path.length() == 0) {
		m_home = std::make_shared<std::string>(dir_path);
		db::StorageManager::reset();
		return std::make_pair(true, "");
	}

	std::vector<std::string> path_components = path_split(dir_path); // cleans any extraneous /'s
	std::string cleaned_dir_path = dir_path[0] == '/' ? "" : ".";
	for (const auto &component : path_components) {
		cleaned_dir_path += "/" + component;
	}
	if (cleaned_dir_path.empty()) {
		cleaned_dir_path = "/";
	}

	auto [ok, err] = mkdir_and_parents_if_needed(cleaned_dir_path);
	if (!ok) {
		return std::make_pair(false, "An issue was encountered with the provided tim home path: " + err);
	}

	m_home = std::make_shared<std::string>(cleaned_dir_path);

	// Drop the shared database so it re-opens under the new home
	db::StorageManager::reset();

	return std::make_pair(true, "");
}

std::pair<bool, std::string> Context::mkdir_and_parents_if_needed(const std::string dir_path) {
	mode_t mode = 0700;

	int result;
	std::string current_level = (!dir_path.empty() && dir_path[0] == '/') ? "" : ".";
	std::vector<std::string> path_components = path_split(dir_path);
	for (const auto &component : path_components) {
		current_level += "/" + component;
		result = mkdir(current_level.c_str(), mode);
		if ((result < 0) && errno != EEXIST) {
			std::string err_prefix{"There was an error while creating/checking "
								   "the directory: mkdir error: "};
			return std::make_pair(false, err_prefix + strerror(errno));
		}
	}

	return std::make_pair(true, "");
}

std::vector<std::string> Context::path_split(std::string path) {
	std::vector<std::string> path_components;
	std::stringstream ss(path);
	std::string component;

	while (std::getline(ss, component, '/')) {
		if (!component.empty()) {
			path_components.push_back(component);
		}
	}

	return path_components;
}

} // namespace timdb

#ifndef TIMDB_INTERNAL_H
#define TIMDB_INTERNAL_H

#include "timdb_db.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace timdb {

using Project = db::Project;
using Workspace = db::Workspace;
using WorkspaceLock = db::WorkspaceLock;
using Assignment = db::Assignment;

/**
 * Current time as milliseconds since the Unix epoch.
 */
int64_t now_ms();

/**
 * Parse an ISO-8601 UTC timestamp ("2024-01-02T03:04:05.678Z", a space in
 * place of the T, or a +hh:mm offset in place of the Z) into milliseconds
 * since the Unix epoch.
 * @return std::nullopt if the string is not a timestamp
 */
std::optional<int64_t> parse_iso8601_ms(const std::string &timestamp);

/**
 * Optional project attributes. On creation, absent fields are stored as NULL.
 */
struct ProjectDetails {
	std::optional<std::string> remote_url;
	std::optional<std::string> last_git_root;
	std::optional<std::string> external_config_path;
	std::optional<std::string> external_tasks_dir;
	std::optional<std::string> remote_label;
};

/**
 * Partial project update: absent fields are left alone, an empty string
 * clears the column.
 */
using ProjectUpdate = ProjectDetails;

/**
 * The Projects class owns the project table: one row per repository the
 * CLI manages state for, keyed by its repository identifier.
 */
class Projects {
  public:
	/**
	 * Fetch the project for repository_id, inserting it with the given
	 * details if it does not exist. Concurrent creators all get the same row.
	 */
	static Project get_or_create(db::Database &db, const std::string &repository_id,
								 const ProjectDetails &details = {});

	static std::optional<Project> get(db::Database &db, const std::string &repository_id);
	static std::optional<Project> get_by_id(db::Database &db, int64_t project_id);

	/**
	 * Apply a partial update and bump updated_at.
	 * @return false if no project has that id
	 */
	static bool update(db::Database &db, int64_t project_id, const ProjectUpdate &fields);

	/**
	 * Reserve a block of count plan ids.
	 *
	 * highest_plan_id becomes max(highest_plan_id, local_max_observed) + count
	 * in a single statement under the write lock, so callers in different
	 * processes never receive overlapping blocks. The project is created if
	 * it does not exist yet.
	 *
	 * @return (first, last) of the reserved block, inclusive
	 * @throws Error(InvalidArgument) if count < 1 or local_max_observed < 0
	 */
	static std::pair<int64_t, int64_t> reserve_next_plan_id(db::Database &db, const std::string &repository_id,
															 int64_t local_max_observed, int64_t count = 1);

	/**
	 * Raise highest_plan_id to at least value; never lowers it.
	 */
	static void raise_highest_plan_id(db::Database &db, int64_t project_id, int64_t value);

	static std::vector<Project> list(db::Database &db);
};

struct WorkspaceInput {
	int64_t project_id = 0;
	std::string workspace_path;
	std::optional<std::string> task_id;
	std::optional<std::string> original_plan_file_path;
	std::optional<std::string> branch;
	std::optional<std::string> name;
	std::optional<std::string> description;
	std::optional<std::string> plan_id;
	std::optional<std::string> plan_title;
};

/**
 * Partial workspace update: absent fields are left alone, an empty string
 * clears the column.
 */
struct WorkspacePatch {
	std::optional<std::string> task_id;
	std::optional<std::string> original_plan_file_path;
	std::optional<std::string> branch;
	std::optional<std::string> name;
	std::optional<std::string> description;
	std::optional<std::string> plan_id;
	std::optional<std::string> plan_title;
};

class Workspaces {
  public:
	/**
	 * Insert or update the workspace keyed by its path. Absent input fields
	 * keep the stored value; created_at is preserved on update.
	 * @throws Error(ConstraintViolation) if project_id does not exist
	 */
	static Workspace record(db::Database &db, const WorkspaceInput &input);

	static std::optional<Workspace> get_by_path(db::Database &db, const std::string &workspace_path);
	static std::optional<Workspace> get_by_id(db::Database &db, int64_t workspace_id);
	static std::vector<Workspace> find_by_task_id(db::Database &db, const std::string &task_id);
	static std::vector<Workspace> find_by_project_id(db::Database &db, int64_t project_id);

	/**
	 * @return The updated workspace, or std::nullopt if the path is unknown
	 */
	static std::optional<Workspace> patch(db::Database &db, const std::string &workspace_path,
										  const WorkspacePatch &fields);

	/**
	 * Delete the workspace. Its issues and lock go with it; assignments that
	 * pointed at it are deleted when unclaimed, otherwise they lose the
	 * workspace pointer.
	 * @return false if the path is unknown
	 */
	static bool remove(db::Database &db, const std::string &workspace_path);

	static void set_issues(db::Database &db, int64_t workspace_id, const std::vector<std::string> &issue_urls);
	static void add_issue(db::Database &db, int64_t workspace_id, const std::string &issue_url);
	static std::vector<std::string> get_issues(db::Database &db, int64_t workspace_id);
};

enum class LockType { Persistent, Pid };

const char *lock_type_name(LockType type);
std::optional<LockType> parse_lock_type(const std::string &name);

struct LockRequest {
	LockType type = LockType::Persistent;
	std::optional<int64_t> pid;			 // defaults to the calling process
	std::optional<std::string> hostname; // defaults to gethostname()
	std::string command;
	std::optional<std::string> owner; // recorded as "<command> (owner: <owner>)"
};

struct ReleaseOptions {
	bool force = false;
	std::optional<int64_t> pid; // defaults to the calling process
};

/**
 * Advisory workspace locks.
 *
 * A lock row is a convention between cooperating tim processes; nothing
 * stops a process that does not consult this table. A "pid" lock goes
 * stale when its process has exited, its start time cannot be parsed or it
 * is older than STALE_LOCK_TIMEOUT_MS. Stale locks are reclaimed inline by
 * acquire() and inspect(). "persistent" locks never go stale.
 */
class WorkspaceLocks {
  public:
	static constexpr int64_t STALE_LOCK_TIMEOUT_MS = 24 * 60 * 60 * 1000;

	/**
	 * @throws Error(AlreadyLocked) if a live lock is held
	 */
	static WorkspaceLock acquire(db::Database &db, int64_t workspace_id, const LockRequest &request);

	/**
	 * force removes any lock. Otherwise a pid lock is removed when it is held
	 * by options.pid or is stale; a persistent lock is only removed by force.
	 * @return true if a lock row was removed
	 */
	static bool release(db::Database &db, int64_t workspace_id, const ReleaseOptions &options = {});

	/**
	 * Current lock, after reclaiming it if stale.
	 */
	static std::optional<WorkspaceLock> inspect(db::Database &db, int64_t workspace_id);

	/**
	 * Current lock row as stored, stale or not.
	 */
	static std::optional<WorkspaceLock> inspect_including_stale(db::Database &db, int64_t workspace_id);

	static bool is_locked(db::Database &db, int64_t workspace_id);

	/**
	 * @return Number of stale locks removed
	 */
	static int clean_stale(db::Database &db);

	static bool is_stale(const WorkspaceLock &lock, int64_t now);
	static bool is_process_alive(int64_t pid);

  private:
	static bool reclaim_if_stale(db::Database &db, const WorkspaceLock &lock);
};

enum class PermissionType { Allow, Deny };

const char *permission_type_name(PermissionType type);
std::optional<PermissionType> parse_permission_type(const std::string &name);

struct PermissionSet {
	std::vector<std::string> allow;
	std::vector<std::string> deny;
};

class Permissions {
  public:
	static PermissionSet get(db::Database &db, int64_t project_id);

	/**
	 * @return true if the pattern was inserted, false if it was already present
	 */
	static bool add(db::Database &db, int64_t project_id, PermissionType type, const std::string &pattern);
	static bool remove(db::Database &db, int64_t project_id, PermissionType type, const std::string &pattern);
	static void replace_all(db::Database &db, int64_t project_id, const PermissionSet &permissions);
};

struct ClaimResult {
	Assignment assignment;
	bool created = false;
	bool updated_workspace = false;
	bool updated_user = false;
};

struct ReleaseResult {
	bool existed = false;
	bool removed = false;
	bool cleared_workspace = false;
	bool cleared_user = false;
};

/**
 * Plan assignments: which workspace and user currently hold a plan. Only
 * current state is kept; a fully released assignment is deleted.
 */
class Assignments {
  public:
	/**
	 * Claim plan_uuid for the given workspace and user. New rows start as
	 * "in_progress"; an existing row takes the new plan id, workspace and
	 * user and keeps its status.
	 */
	static ClaimResult claim(db::Database &db, int64_t project_id, const std::string &plan_uuid,
							 std::optional<int64_t> plan_id, std::optional<int64_t> workspace_id = std::nullopt,
							 const std::optional<std::string> &user = std::nullopt);

	/**
	 * Release a claim. With neither workspace_path nor user the row is
	 * deleted. Otherwise the workspace pointer is cleared if it matches
	 * workspace_path, and the user is cleared if it matches and the
	 * workspace did not mismatch. A row left with neither is deleted.
	 */
	static ReleaseResult release(db::Database &db, int64_t project_id, const std::string &plan_uuid,
								 const std::optional<std::string> &workspace_path = std::nullopt,
								 const std::optional<std::string> &user = std::nullopt);

	static std::optional<Assignment> get(db::Database &db, int64_t project_id, const std::string &plan_uuid);
	static std::vector<Assignment> list_by_project(db::Database &db, int64_t project_id);
	static bool remove(db::Database &db, int64_t project_id, const std::string &plan_uuid);

	/**
	 * Delete assignments of the project not updated in stale_days days.
	 * @throws Error(InvalidArgument) if stale_days is negative
	 */
	static int clean_stale(db::Database &db, int64_t project_id, int stale_days);

	/**
	 * Insert a row verbatim, keeping status and timestamps. Existing rows
	 * for the same plan are left untouched.
	 * @return true if a row was inserted
	 */
	static bool import_row(db::Database &db, const Assignment &row);
};

class Context {
  public:
	Context() {}

	/**
	 * Set the tim home (config root) directory and drop the shared database
	 * so the next access opens <home>/tim.db. An empty string unsets it.
	 */
	static std::pair<bool, std::string> set_tim_home(const std::string tim_home);

	static std::string get_tim_home() {
		return *m_home;
	}

	static std::pair<bool, std::string> mkdir_and_parents_if_needed(const std::string dir_path);

  private:
	static std::shared_ptr<std::string> m_home;

	static std::vector<std::string> path_split(const std::string dir_path);
};

} // namespace timdb

#endif // TIMDB_INTERNAL_H

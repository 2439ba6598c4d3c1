/**
 * Public header for the timdb C Library
 *
 * timdb is the persistent state store shared by every tim process on a
 * machine: projects, workspaces, workspace locks, shell command permissions
 * and plan assignments, kept in one SQLite database under the tim config
 * directory.
 */

#ifndef TIMDB_H
#define TIMDB_H

#include <memory>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// DB timeout
extern std::shared_ptr<int> timdb_db_timeout;

/*
Return codes shared by all APIs
*/
#define TIMDB_OK 0
#define TIMDB_ERR_GENERIC -1
#define TIMDB_ERR_STORAGE_UNAVAILABLE -2
#define TIMDB_ERR_MIGRATION_FAILED -3
#define TIMDB_ERR_BUSY -4
#define TIMDB_ERR_CONSTRAINT -5
#define TIMDB_ERR_ALREADY_LOCKED -6
#define TIMDB_ERR_INVALID_ARGUMENT -7

/*
APIs
*/

const char *timdb_version();
/**
	DESCRIPTION: Returns current version of timdb
*/

void timdb_free_string(char *str);
/**
	DESCRIPTION: Frees a string returned through an output or err_msg argument.
*/

/*
Projects
*/

int timdb_get_or_create_project(const char *repository_id, const char *details_JSON_str, char **output,
								char **err_msg);
/**
	DESCRIPTION: Returns the project for a repository, creating it if it does not exist yet. Safe to call
		concurrently from several processes; all of them receive the same row.

	RETURNS: Returns 0 on success. Any other values indicate an error.

	INPUTS:
	repository_id:
		The stable identifier of the repository.

	details_JSON_str:
		Optional (may be NULL). Attributes used only when the project is created:
		{"remote_url": str, "last_git_root": str, "external_config_path": str,
		 "external_tasks_dir": str, "remote_label": str}

	output:
		The project as a JSON object with the keys "id", "repository_id", "remote_url", "last_git_root",
		"external_config_path", "external_tasks_dir", "remote_label", "highest_plan_id", "created_at"
		and "updated_at". Unset attributes are null.

	err_msg:
		A reference to a char array that can store any error messages.
*/

int timdb_get_project(const char *repository_id, char **output, char **err_msg);
/**
	DESCRIPTION: Looks up a project by repository identifier.

	RETURNS: Returns 1 and sets output if the project exists, 0 if it does not. Negative values indicate an error.
*/

int timdb_update_project(const int64_t project_id, const char *update_JSON_str, char **err_msg);
/**
	DESCRIPTION: Updates the supplied project attributes and bumps updated_at. Keys are as in the details
		object of timdb_get_or_create_project; missing keys are left unchanged and an empty string clears
		the attribute.

	RETURNS: Returns 1 if the project exists and was updated, 0 if it does not exist. Negative values indicate
		an error.
*/

int timdb_reserve_plan_ids(const char *repository_id, const int64_t local_max_observed, const int64_t count,
						   int64_t *first, int64_t *last, char **err_msg);
/**
	DESCRIPTION: Atomically reserves a block of `count` plan ids for the repository. The project's
		highest_plan_id becomes max(highest_plan_id, local_max_observed) + count, and the ids in
		[first, last] belong to the caller alone. The project is created if needed.

	RETURNS: Returns 0 on success, TIMDB_ERR_INVALID_ARGUMENT if count < 1 or local_max_observed < 0.

	INPUTS:
	local_max_observed:
		The highest plan id the caller has seen on disk, so ids never go backwards relative to local files.
*/

int timdb_list_projects(char **output, char **err_msg);
/**
	DESCRIPTION: Returns a JSON array of all projects, ordered by id.
*/

/*
Workspaces
*/

int timdb_record_workspace(const char *workspace_JSON_str, char **output, char **err_msg);
/**
	DESCRIPTION: Inserts or updates the workspace at a path. When the path is already known, attributes
		missing from the input keep their stored values.

	RETURNS: Returns 0 on success, TIMDB_ERR_CONSTRAINT if project_id does not name a project.

	INPUTS:
	workspace_JSON_str:
{   "project_id":
		REQUIRED: The id of the owning project.
	"workspace_path":
		REQUIRED: The absolute path of the workspace checkout.
	"task_id", "original_plan_file_path", "branch", "name", "description", "plan_id", "plan_title":
		OPTIONAL: Strings.
}

	output:
		The stored workspace as a JSON object with the keys above plus "id", "created_at" and "updated_at".
*/

int timdb_get_workspace(const char *workspace_path, char **output, char **err_msg);
/**
	DESCRIPTION: Looks up a workspace by path.

	RETURNS: Returns 1 and sets output if the workspace exists, 0 if it does not. Negative values indicate
		an error.
*/

int timdb_find_workspaces_by_task(const char *task_id, char **output, char **err_msg);
int timdb_find_workspaces_by_project(const int64_t project_id, char **output, char **err_msg);
/**
	DESCRIPTION: Return a JSON array of the workspaces with the given task id / project id.
*/

int timdb_patch_workspace(const char *workspace_path, const char *patch_JSON_str, char **output, char **err_msg);
/**
	DESCRIPTION: Updates the supplied workspace attributes ("task_id", "original_plan_file_path", "branch",
		"name", "description", "plan_id", "plan_title") and bumps updated_at. An empty string clears the
		attribute.

	RETURNS: Returns 1 and sets output to the updated workspace, 0 if the path is unknown. Negative values
		indicate an error.
*/

int timdb_delete_workspace(const char *workspace_path, char **err_msg);
/**
	DESCRIPTION: Deletes a workspace together with its issues and lock. Assignments pointing at it are
		deleted when no user claims them; otherwise they stay with no workspace.

	RETURNS: Returns 1 if the workspace was deleted, 0 if the path is unknown. Negative values indicate an error.
*/

int timdb_set_workspace_issues(const int64_t workspace_id, const char *issues_JSON_str, char **err_msg);
/**
	DESCRIPTION: Replaces the issue URLs attached to a workspace with the given JSON array of strings.
*/

int timdb_add_workspace_issue(const int64_t workspace_id, const char *issue_url, char **err_msg);
int timdb_get_workspace_issues(const int64_t workspace_id, char **output, char **err_msg);

/*
Workspace locks
*/

int timdb_acquire_workspace_lock(const int64_t workspace_id, const char *lock_JSON_str, char **output,
								 char **err_msg);
/**
	DESCRIPTION: Takes the workspace lock. A stale "pid" lock (its process is gone, or it is more than 24 hours
		old) is reclaimed first. Locks are advisory: they only exclude other callers of this API.

	RETURNS: Returns 0 on success, TIMDB_ERR_ALREADY_LOCKED if a live lock is held.

	INPUTS:
	lock_JSON_str:
{   "type":
		OPTIONAL: "persistent" (default) or "pid". Persistent locks never go stale.
	"pid":
		OPTIONAL: The owning process. Defaults to the calling process.
	"hostname":
		OPTIONAL: Defaults to this host's name.
	"command":
		REQUIRED: A description of what holds the lock.
	"owner":
		OPTIONAL: A readable name for the holder, stored as "<command> (owner: <owner>)".
}

	output:
		The lock as a JSON object: {"workspace_id", "lock_type", "pid", "started_at", "hostname", "command"}
*/

int timdb_release_workspace_lock(const int64_t workspace_id, const char *options_JSON_str, char **err_msg);
/**
	DESCRIPTION: Releases the workspace lock. Without force, only a "pid" lock held by the given pid (default:
		the calling process) or a stale one is released.

	RETURNS: Returns 1 if a lock was released, 0 otherwise. Negative values indicate an error.

	INPUTS:
	options_JSON_str:
		Optional (may be NULL). {"force": bool, "pid": int}
*/

int timdb_get_workspace_lock(const int64_t workspace_id, char **output, char **err_msg);
/**
	DESCRIPTION: Returns the live lock on a workspace, reclaiming it first if it is stale.

	RETURNS: Returns 1 and sets output if the workspace is locked, 0 if it is not. Negative values indicate
		an error.
*/

int timdb_clean_stale_locks(int *removed, char **err_msg);

/*
Permissions
*/

int timdb_get_permissions(const int64_t project_id, char **output, char **err_msg);
/**
	DESCRIPTION: Returns the approved command patterns of a project as {"allow": [str], "deny": [str]}.
*/

int timdb_add_permission(const int64_t project_id, const char *permission_type, const char *pattern,
						 char **err_msg);
int timdb_remove_permission(const int64_t project_id, const char *permission_type, const char *pattern,
							char **err_msg);
/**
	DESCRIPTION: Add or remove one pattern. permission_type is "allow" or "deny".

	RETURNS: Returns 1 if a row was added/removed, 0 if there was nothing to do. Negative values indicate
		an error.
*/

int timdb_set_permissions(const int64_t project_id, const char *permissions_JSON_str, char **err_msg);
/**
	DESCRIPTION: Replaces every pattern of the project with {"allow": [str], "deny": [str]}.
*/

/*
Assignments
*/

int timdb_claim_assignment(const char *claim_JSON_str, char **output, char **err_msg);
/**
	DESCRIPTION: Claims a plan for a workspace and/or user. A new claim starts with status "in_progress"; an
		existing one takes the new plan id, workspace and user and keeps its status.

	RETURNS: Returns 0 on success. Any other values indicate an error.

	INPUTS:
	claim_JSON_str:
{   "project_id": REQUIRED int, "plan_uuid": REQUIRED str,
	"plan_id": int or null, "workspace_id": int or null, "user": str or null }

	output:
		{"assignment": {...}, "created": bool, "updated_workspace": bool, "updated_user": bool}
*/

int timdb_release_assignment(const char *release_JSON_str, char **output, char **err_msg);
/**
	DESCRIPTION: Releases a claim. With neither "workspace_path" nor "user" the assignment is deleted.
		Otherwise the matching side is cleared, and the assignment is deleted once neither side remains.
		Releasing an unknown assignment is not an error.

	INPUTS:
	release_JSON_str:
{   "project_id": REQUIRED int, "plan_uuid": REQUIRED str,
	"workspace_path": str or null, "user": str or null }

	output:
		{"existed": bool, "removed": bool, "cleared_workspace": bool, "cleared_user": bool}
*/

int timdb_get_assignment(const int64_t project_id, const char *plan_uuid, char **output, char **err_msg);
/**
	RETURNS: Returns 1 and sets output if the assignment exists, 0 if it does not. Negative values indicate
		an error.
*/

int timdb_list_assignments(const int64_t project_id, char **output, char **err_msg);
int timdb_clean_stale_assignments(const int64_t project_id, const int stale_days, int *removed, char **err_msg);

/*
Context
*/

int timdb_set_context_str(const char *key, const char *value, char **err_msg);
/**
	DESCRIPTION: Set a string context value.

	RETURNS: Returns 0 on success. Any other values indicate an error.

	INPUTS:
	key:
		"tim_home": the config root directory holding tim.db and the legacy JSON files. Setting it closes
			the shared database; the next call opens the one under the new directory. "" restores the
			default ($TIM_CONFIG_ROOT, $XDG_CONFIG_HOME/tim, then ~/.config/tim).
		"log_level": "trace", "debug", "info", "warn", "error", "critical" or "off".

	err_msg:
		A reference to a char array that can store any error messages.
*/

int timdb_get_context_str(const char *key, char **output, char **err_msg);

int timdb_set_context_int(const char *key, const int value, char **err_msg);
/**
	DESCRIPTION: Set an integer context value.

	INPUTS:
	key:
		"db_timeout": how long, in milliseconds, to wait for another process's write lock before
		failing with TIMDB_ERR_BUSY. Applies to databases opened after the call.
*/

int timdb_get_context_int(const char *key, int *output, char **err_msg);

#ifdef __cplusplus
}
#endif

#endif // TIMDB_H

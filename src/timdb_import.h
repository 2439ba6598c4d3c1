/**
 * One-time import of the legacy JSON state files.
 *
 * Before the database existed, tim kept its state in JSON files under the
 * config root:
 *
 *   shared/<repository id>/assignments.json   plan claims and highestPlanId
 *   shared/<repository id>/permissions.json   approved shell command patterns
 *   workspaces.json                           every known workspace, by path
 *   repositories/<repository id>/metadata.json  external storage settings
 *
 * Importing happens in two steps: collect_legacy_data() and
 * build_import_plan() read and map the files without touching the
 * database, apply_import_plan() writes the result in one transaction.
 * The files themselves are never modified.
 */

#ifndef TIMDB_IMPORT_H
#define TIMDB_IMPORT_H

#include "timdb_db.h"
#include "timdb_internal.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace timdb {
namespace import {

struct LegacyAssignment {
	std::optional<int64_t> plan_id;
	std::vector<std::string> workspace_paths;
	std::map<std::string, std::string> workspace_owners;
	std::vector<std::string> users;
	std::optional<std::string> status;
	std::string assigned_at;
	std::string updated_at;
};

struct LegacyAssignmentsFile {
	std::string repository_id;
	std::optional<std::string> repository_remote_url;
	std::optional<int64_t> highest_plan_id;
	std::map<std::string, LegacyAssignment> assignments; // keyed by plan uuid
};

struct LegacyPermissionsFile {
	std::string repository_id;
	PermissionSet permissions;
};

struct LegacyWorkspace {
	std::string task_id;
	std::string workspace_path;
	std::optional<std::string> repository_id;
	std::optional<std::string> original_plan_file_path;
	std::optional<std::string> branch;
	std::optional<std::string> name;
	std::optional<std::string> description;
	std::optional<std::string> plan_id;
	std::optional<std::string> plan_title;
	std::vector<std::string> issue_urls;
	std::string created_at;
	std::optional<std::string> updated_at;
};

struct LegacyMetadata {
	std::string repository_name;
	std::optional<std::string> remote_label;
	std::optional<std::string> last_git_root;
	std::optional<std::string> external_config_path;
	std::optional<std::string> external_tasks_dir;
};

struct LegacyRepository {
	std::optional<LegacyAssignmentsFile> assignments;
	std::optional<LegacyPermissionsFile> permissions;
	std::optional<LegacyMetadata> metadata;
};

struct LegacyData {
	std::map<std::string, LegacyRepository> repositories; // keyed by directory name
	std::map<std::string, LegacyWorkspace> workspaces;	  // keyed by workspace path
};

struct ProjectSeed {
	std::string repository_id;
	ProjectDetails details;
	bool apply_details = false; // details also overwrite an existing row
	std::optional<int64_t> highest_plan_id;
	std::optional<PermissionSet> permissions;
};

struct WorkspaceSeed {
	std::string repository_id;
	WorkspaceInput workspace; // project_id is resolved when applied
	std::vector<std::string> issue_urls;
};

struct AssignmentSeed {
	std::string repository_id;
	std::string plan_uuid;
	std::optional<int64_t> plan_id;
	std::optional<std::string> workspace_path;
	std::optional<std::string> claimed_by_user;
	std::optional<std::string> status;
	std::string assigned_at;
	std::string updated_at;
};

struct ImportPlan {
	std::vector<ProjectSeed> projects;
	std::vector<WorkspaceSeed> workspaces;
	std::vector<AssignmentSeed> assignments;
};

struct ImportSummary {
	int projects = 0;
	int workspaces = 0;
	int assignments = 0;
	int permissions = 0;
};

/**
 * Read every legacy file under config_root. Missing, unparsable or
 * malformed files (and malformed workspace entries) are logged and skipped.
 */
LegacyData collect_legacy_data(const std::string &config_root);

/**
 * Map legacy data to rows. No I/O.
 *
 * A legacy assignment may list several workspaces; it collapses to the one
 * most recently updated according to the workspace file (first listed if
 * none are known), claimed by that workspace's owner or else the first user.
 */
ImportPlan build_import_plan(const LegacyData &data);

/**
 * Write the plan in one immediate transaction. Safe to re-run: existing
 * projects, workspaces and assignments are reused, not duplicated.
 */
ImportSummary apply_import_plan(db::Database &db, const ImportPlan &plan);

/**
 * Run the import if it has not completed yet and the database holds no
 * projects, then mark it completed.
 * @return true if an import ran
 */
bool import_if_needed(db::Database &db, const std::string &config_root);

} // namespace import
} // namespace timdb

#endif // TIMDB_IMPORT_H

#include "timdb.h"

#include "timdb_db.h"
#include "timdb_internal.h"
#include "timdb_log.h"
#include "timdb_version.h"
#include "schemas.h"

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <stdlib.h>
#include <string.h>

/*
Initialize some context globals
*/

// Tim home
std::shared_ptr<std::string> timdb::Context::m_home = std::make_shared<std::string>("");

std::shared_ptr<int> timdb_db_timeout = std::make_shared<int>(5000); // in ms

using json = nlohmann::json;
using json_validator = nlohmann::json_schema::json_validator;

namespace {

int return_code(timdb::ErrorCode code) {
	switch (code) {
		case timdb::ErrorCode::StorageUnavailable:
			return TIMDB_ERR_STORAGE_UNAVAILABLE;
		case timdb::ErrorCode::MigrationFailed:
			return TIMDB_ERR_MIGRATION_FAILED;
		case timdb::ErrorCode::Busy:
			return TIMDB_ERR_BUSY;
		case timdb::ErrorCode::ConstraintViolation:
			return TIMDB_ERR_CONSTRAINT;
		case timdb::ErrorCode::AlreadyLocked:
			return TIMDB_ERR_ALREADY_LOCKED;
		case timdb::ErrorCode::InvalidArgument:
			return TIMDB_ERR_INVALID_ARGUMENT;
		case timdb::ErrorCode::StorageError:
			break;
	}
	return TIMDB_ERR_GENERIC;
}

void set_err(char **err_msg, const std::string &message) {
	if (err_msg) {
		*err_msg = strdup(message.c_str());
	}
}

void set_output(char **output, const std::string &value) {
	if (output) {
		*output = strdup(value.c_str());
	}
}

/**
 * Run an API body, turning exceptions into a return code and err_msg.
 * Malformed or schema-violating JSON input is an invalid argument.
 */
template <typename F> int guarded(const char *api, char **err_msg, F &&fn) {
	try {
		return fn();
	} catch (const timdb::Error &exc) {
		timdb::log::debug("API call failed", {timdb::log::string_field("api", api),
											  timdb::log::string_field("code", timdb::error_code_name(exc.code()))});
		set_err(err_msg, exc.what());
		return return_code(exc.code());
	} catch (const std::system_error &exc) {
		auto err = timdb::db::error_from_system_error(exc);
		set_err(err_msg, err.what());
		return return_code(err.code());
	} catch (const json::exception &exc) {
		set_err(err_msg, std::string("Invalid JSON input: ") + exc.what());
		return TIMDB_ERR_INVALID_ARGUMENT;
	} catch (const std::invalid_argument &exc) {
		// json_validator reports schema violations this way
		set_err(err_msg, std::string("Invalid input: ") + exc.what());
		return TIMDB_ERR_INVALID_ARGUMENT;
	} catch (const std::exception &exc) {
		set_err(err_msg, exc.what());
		return TIMDB_ERR_GENERIC;
	}
}

std::string require(const char *value, const char *name) {
	if (!value) {
		throw timdb::Error(timdb::ErrorCode::InvalidArgument, std::string("A value for ") + name + " must be provided.");
	}
	return value;
}

json parse_and_validate(const char *json_str, const json &schema, const char *name) {
	json obj = json::parse(require(json_str, name));

	json_validator validator;
	validator.set_root_schema(schema);
	validator.validate(obj);
	return obj;
}

template <typename T> json nullable(const std::optional<T> &value) {
	if (value) {
		return *value;
	}
	return nullptr;
}

std::optional<std::string> optional_string(const json &obj, const char *key) {
	if (!obj.contains(key) || obj[key].is_null()) {
		return std::nullopt;
	}
	return obj[key].get<std::string>();
}

std::optional<int64_t> optional_int(const json &obj, const char *key) {
	if (!obj.contains(key) || obj[key].is_null()) {
		return std::nullopt;
	}
	return obj[key].get<int64_t>();
}

json project_to_json(const timdb::Project &project) {
	return json{{"id", project.id},
				{"repository_id", project.repository_id},
				{"remote_url", nullable(project.remote_url)},
				{"last_git_root", nullable(project.last_git_root)},
				{"external_config_path", nullable(project.external_config_path)},
				{"external_tasks_dir", nullable(project.external_tasks_dir)},
				{"remote_label", nullable(project.remote_label)},
				{"highest_plan_id", project.highest_plan_id},
				{"created_at", project.created_at},
				{"updated_at", project.updated_at}};
}

json workspace_to_json(const timdb::Workspace &workspace) {
	return json{{"id", workspace.id},
				{"project_id", workspace.project_id},
				{"task_id", nullable(workspace.task_id)},
				{"workspace_path", workspace.workspace_path},
				{"original_plan_file_path", nullable(workspace.original_plan_file_path)},
				{"branch", nullable(workspace.branch)},
				{"name", nullable(workspace.name)},
				{"description", nullable(workspace.description)},
				{"plan_id", nullable(workspace.plan_id)},
				{"plan_title", nullable(workspace.plan_title)},
				{"created_at", workspace.created_at},
				{"updated_at", workspace.updated_at}};
}

json lock_to_json(const timdb::WorkspaceLock &lock) {
	return json{{"workspace_id", lock.workspace_id}, {"lock_type", lock.lock_type}, {"pid", nullable(lock.pid)},
				{"started_at", lock.started_at},	 {"hostname", lock.hostname},	{"command", lock.command}};
}

json assignment_to_json(const timdb::Assignment &assignment) {
	return json{{"id", assignment.id},
				{"project_id", assignment.project_id},
				{"plan_uuid", assignment.plan_uuid},
				{"plan_id", nullable(assignment.plan_id)},
				{"workspace_id", nullable(assignment.workspace_id)},
				{"workspace_path", nullable(assignment.workspace_path)},
				{"claimed_by_user", nullable(assignment.claimed_by_user)},
				{"status", nullable(assignment.status)},
				{"assigned_at", assignment.assigned_at},
				{"updated_at", assignment.updated_at}};
}

timdb::ProjectDetails details_from_json(const json &obj) {
	timdb::ProjectDetails details;
	details.remote_url = optional_string(obj, "remote_url");
	details.last_git_root = optional_string(obj, "last_git_root");
	details.external_config_path = optional_string(obj, "external_config_path");
	details.external_tasks_dir = optional_string(obj, "external_tasks_dir");
	details.remote_label = optional_string(obj, "remote_label");
	return details;
}

timdb::PermissionType permission_type_from(const char *name) {
	auto type = timdb::parse_permission_type(require(name, "permission_type"));
	if (!type) {
		throw timdb::Error(timdb::ErrorCode::InvalidArgument,
						   "Unknown permission type \"" + std::string(name) + "\"; expected \"allow\" or \"deny\".");
	}
	return *type;
}

std::string unrecognized_key(const char *key) {
	return "Unrecognized key: " + static_cast<std::string>(key);
}

} // namespace

/*
APIs
*/

const char *timdb_version() {
	std::string major = std::to_string(Timdb_VERSION_MAJOR);
	std::string minor = std::to_string(Timdb_VERSION_MINOR);
	std::string patch = std::to_string(Timdb_VERSION_PATCH);
	static std::string version = "v" + major + "." + minor + "." + patch;

	return version.c_str();
}

void timdb_free_string(char *str) {
	free(str);
}

int timdb_get_or_create_project(const char *repository_id, const char *details_JSON_str, char **output,
								char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string repo = require(repository_id, "repository_id");
		if (repo.empty()) {
			throw timdb::Error(timdb::ErrorCode::InvalidArgument, "The repository id must not be empty.");
		}

		timdb::ProjectDetails details;
		if (details_JSON_str) {
			details =
				details_from_json(parse_and_validate(details_JSON_str, timdb_schemas::project_details_schema, "details"));
		}

		auto &db = timdb::db::StorageManager::shared();
		auto project = timdb::Projects::get_or_create(db, repo, details);
		set_output(output, project_to_json(project).dump());
		return TIMDB_OK;
	});
}

int timdb_get_project(const char *repository_id, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string repo = require(repository_id, "repository_id");
		auto project = timdb::Projects::get(timdb::db::StorageManager::shared(), repo);
		if (!project) {
			return 0;
		}
		set_output(output, project_to_json(*project).dump());
		return 1;
	});
}

int timdb_update_project(const int64_t project_id, const char *update_JSON_str, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json update_obj = parse_and_validate(update_JSON_str, timdb_schemas::project_details_schema, "update");
		bool updated =
			timdb::Projects::update(timdb::db::StorageManager::shared(), project_id, details_from_json(update_obj));
		return updated ? 1 : 0;
	});
}

int timdb_reserve_plan_ids(const char *repository_id, const int64_t local_max_observed, const int64_t count,
						   int64_t *first, int64_t *last, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string repo = require(repository_id, "repository_id");
		auto [start, end] =
			timdb::Projects::reserve_next_plan_id(timdb::db::StorageManager::shared(), repo, local_max_observed, count);
		if (first) {
			*first = start;
		}
		if (last) {
			*last = end;
		}
		return TIMDB_OK;
	});
}

int timdb_list_projects(char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json projects = json::array();
		for (const auto &project : timdb::Projects::list(timdb::db::StorageManager::shared())) {
			projects.push_back(project_to_json(project));
		}
		set_output(output, projects.dump());
		return TIMDB_OK;
	});
}

int timdb_record_workspace(const char *workspace_JSON_str, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json ws_obj = parse_and_validate(workspace_JSON_str, timdb_schemas::workspace_record_schema, "workspace");

		timdb::WorkspaceInput input;
		input.project_id = ws_obj["project_id"].get<int64_t>();
		input.workspace_path = ws_obj["workspace_path"].get<std::string>();
		input.task_id = optional_string(ws_obj, "task_id");
		input.original_plan_file_path = optional_string(ws_obj, "original_plan_file_path");
		input.branch = optional_string(ws_obj, "branch");
		input.name = optional_string(ws_obj, "name");
		input.description = optional_string(ws_obj, "description");
		input.plan_id = optional_string(ws_obj, "plan_id");
		input.plan_title = optional_string(ws_obj, "plan_title");

		auto workspace = timdb::Workspaces::record(timdb::db::StorageManager::shared(), input);
		set_output(output, workspace_to_json(workspace).dump());
		return TIMDB_OK;
	});
}

int timdb_get_workspace(const char *workspace_path, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string path = require(workspace_path, "workspace_path");
		auto workspace = timdb::Workspaces::get_by_path(timdb::db::StorageManager::shared(), path);
		if (!workspace) {
			return 0;
		}
		set_output(output, workspace_to_json(*workspace).dump());
		return 1;
	});
}

int timdb_find_workspaces_by_task(const char *task_id, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string task = require(task_id, "task_id");
		json workspaces = json::array();
		for (const auto &workspace : timdb::Workspaces::find_by_task_id(timdb::db::StorageManager::shared(), task)) {
			workspaces.push_back(workspace_to_json(workspace));
		}
		set_output(output, workspaces.dump());
		return TIMDB_OK;
	});
}

int timdb_find_workspaces_by_project(const int64_t project_id, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json workspaces = json::array();
		for (const auto &workspace :
			 timdb::Workspaces::find_by_project_id(timdb::db::StorageManager::shared(), project_id)) {
			workspaces.push_back(workspace_to_json(workspace));
		}
		set_output(output, workspaces.dump());
		return TIMDB_OK;
	});
}

int timdb_patch_workspace(const char *workspace_path, const char *patch_JSON_str, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string path = require(workspace_path, "workspace_path");
		json patch_obj = parse_and_validate(patch_JSON_str, timdb_schemas::workspace_patch_schema, "patch");

		timdb::WorkspacePatch fields;
		fields.task_id = optional_string(patch_obj, "task_id");
		fields.original_plan_file_path = optional_string(patch_obj, "original_plan_file_path");
		fields.branch = optional_string(patch_obj, "branch");
		fields.name = optional_string(patch_obj, "name");
		fields.description = optional_string(patch_obj, "description");
		fields.plan_id = optional_string(patch_obj, "plan_id");
		fields.plan_title = optional_string(patch_obj, "plan_title");

		auto workspace = timdb::Workspaces::patch(timdb::db::StorageManager::shared(), path, fields);
		if (!workspace) {
			return 0;
		}
		set_output(output, workspace_to_json(*workspace).dump());
		return 1;
	});
}

int timdb_delete_workspace(const char *workspace_path, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string path = require(workspace_path, "workspace_path");
		return timdb::Workspaces::remove(timdb::db::StorageManager::shared(), path) ? 1 : 0;
	});
}

int timdb_set_workspace_issues(const int64_t workspace_id, const char *issues_JSON_str, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json issues_obj = parse_and_validate(issues_JSON_str, timdb_schemas::issue_urls_schema, "issues");
		timdb::Workspaces::set_issues(timdb::db::StorageManager::shared(), workspace_id,
									  issues_obj.get<std::vector<std::string>>());
		return TIMDB_OK;
	});
}

int timdb_add_workspace_issue(const int64_t workspace_id, const char *issue_url, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string url = require(issue_url, "issue_url");
		if (url.empty()) {
			throw timdb::Error(timdb::ErrorCode::InvalidArgument, "The issue URL must not be empty.");
		}
		timdb::Workspaces::add_issue(timdb::db::StorageManager::shared(), workspace_id, url);
		return TIMDB_OK;
	});
}

int timdb_get_workspace_issues(const int64_t workspace_id, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json issues = timdb::Workspaces::get_issues(timdb::db::StorageManager::shared(), workspace_id);
		set_output(output, issues.dump());
		return TIMDB_OK;
	});
}

int timdb_acquire_workspace_lock(const int64_t workspace_id, const char *lock_JSON_str, char **output,
								 char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json lock_obj = parse_and_validate(lock_JSON_str, timdb_schemas::lock_request_schema, "lock");

		timdb::LockRequest request;
		if (lock_obj.contains("type")) {
			// The schema restricts the value to a known type
			request.type = *timdb::parse_lock_type(lock_obj["type"].get<std::string>());
		}
		request.pid = optional_int(lock_obj, "pid");
		request.hostname = optional_string(lock_obj, "hostname");
		request.command = lock_obj["command"].get<std::string>();
		request.owner = optional_string(lock_obj, "owner");

		auto lock = timdb::WorkspaceLocks::acquire(timdb::db::StorageManager::shared(), workspace_id, request);
		set_output(output, lock_to_json(lock).dump());
		return TIMDB_OK;
	});
}

int timdb_release_workspace_lock(const int64_t workspace_id, const char *options_JSON_str, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		timdb::ReleaseOptions options;
		if (options_JSON_str) {
			json options_obj = parse_and_validate(options_JSON_str, timdb_schemas::lock_release_schema, "options");
			options.force = options_obj.value("force", false);
			options.pid = optional_int(options_obj, "pid");
		}
		return timdb::WorkspaceLocks::release(timdb::db::StorageManager::shared(), workspace_id, options) ? 1 : 0;
	});
}

int timdb_get_workspace_lock(const int64_t workspace_id, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		auto lock = timdb::WorkspaceLocks::inspect(timdb::db::StorageManager::shared(), workspace_id);
		if (!lock) {
			return 0;
		}
		set_output(output, lock_to_json(*lock).dump());
		return 1;
	});
}

int timdb_clean_stale_locks(int *removed, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		int count = timdb::WorkspaceLocks::clean_stale(timdb::db::StorageManager::shared());
		if (removed) {
			*removed = count;
		}
		return TIMDB_OK;
	});
}

int timdb_get_permissions(const int64_t project_id, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		auto permissions = timdb::Permissions::get(timdb::db::StorageManager::shared(), project_id);
		json perms_obj = {{"allow", permissions.allow}, {"deny", permissions.deny}};
		set_output(output, perms_obj.dump());
		return TIMDB_OK;
	});
}

int timdb_add_permission(const int64_t project_id, const char *permission_type, const char *pattern,
						 char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		auto type = permission_type_from(permission_type);
		std::string value = require(pattern, "pattern");
		return timdb::Permissions::add(timdb::db::StorageManager::shared(), project_id, type, value) ? 1 : 0;
	});
}

int timdb_remove_permission(const int64_t project_id, const char *permission_type, const char *pattern,
							char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		auto type = permission_type_from(permission_type);
		std::string value = require(pattern, "pattern");
		return timdb::Permissions::remove(timdb::db::StorageManager::shared(), project_id, type, value) ? 1 : 0;
	});
}

int timdb_set_permissions(const int64_t project_id, const char *permissions_JSON_str, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json perms_obj = parse_and_validate(permissions_JSON_str, timdb_schemas::permission_set_schema, "permissions");

		timdb::PermissionSet permissions;
		permissions.allow = perms_obj.value("allow", std::vector<std::string>{});
		permissions.deny = perms_obj.value("deny", std::vector<std::string>{});
		timdb::Permissions::replace_all(timdb::db::StorageManager::shared(), project_id, permissions);
		return TIMDB_OK;
	});
}

int timdb_claim_assignment(const char *claim_JSON_str, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json claim_obj = parse_and_validate(claim_JSON_str, timdb_schemas::claim_schema, "claim");

		auto result = timdb::Assignments::claim(
			timdb::db::StorageManager::shared(), claim_obj["project_id"].get<int64_t>(),
			claim_obj["plan_uuid"].get<std::string>(), optional_int(claim_obj, "plan_id"),
			optional_int(claim_obj, "workspace_id"), optional_string(claim_obj, "user"));

		json result_obj = {{"assignment", assignment_to_json(result.assignment)},
						   {"created", result.created},
						   {"updated_workspace", result.updated_workspace},
						   {"updated_user", result.updated_user}};
		set_output(output, result_obj.dump());
		return TIMDB_OK;
	});
}

int timdb_release_assignment(const char *release_JSON_str, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json release_obj = parse_and_validate(release_JSON_str, timdb_schemas::assignment_release_schema, "release");

		auto result = timdb::Assignments::release(
			timdb::db::StorageManager::shared(), release_obj["project_id"].get<int64_t>(),
			release_obj["plan_uuid"].get<std::string>(), optional_string(release_obj, "workspace_path"),
			optional_string(release_obj, "user"));

		json result_obj = {{"existed", result.existed},
						   {"removed", result.removed},
						   {"cleared_workspace", result.cleared_workspace},
						   {"cleared_user", result.cleared_user}};
		set_output(output, result_obj.dump());
		return TIMDB_OK;
	});
}

int timdb_get_assignment(const int64_t project_id, const char *plan_uuid, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		std::string uuid = require(plan_uuid, "plan_uuid");
		auto assignment = timdb::Assignments::get(timdb::db::StorageManager::shared(), project_id, uuid);
		if (!assignment) {
			return 0;
		}
		set_output(output, assignment_to_json(*assignment).dump());
		return 1;
	});
}

int timdb_list_assignments(const int64_t project_id, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		json assignments = json::array();
		for (const auto &assignment :
			 timdb::Assignments::list_by_project(timdb::db::StorageManager::shared(), project_id)) {
			assignments.push_back(assignment_to_json(assignment));
		}
		set_output(output, assignments.dump());
		return TIMDB_OK;
	});
}

int timdb_clean_stale_assignments(const int64_t project_id, const int stale_days, int *removed, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		int count = timdb::Assignments::clean_stale(timdb::db::StorageManager::shared(), project_id, stale_days);
		if (removed) {
			*removed = count;
		}
		return TIMDB_OK;
	});
}

int timdb_set_context_str(const char *key, const char *value, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		if (!key) {
			set_err(err_msg, "A key must be provided.");
			return TIMDB_ERR_INVALID_ARGUMENT;
		}

		if (strcmp(key, "tim_home") == 0) {
			auto rp = timdb::Context::set_tim_home(require(value, "tim_home"));
			if (!rp.first) {
				set_err(err_msg, "Failed to set tim home: " + rp.second);
				return TIMDB_ERR_STORAGE_UNAVAILABLE;
			}
		} else if (strcmp(key, "log_level") == 0) {
			if (!timdb::log::set_level(require(value, "log_level"))) {
				set_err(err_msg, "Unknown log level: " + static_cast<std::string>(value));
				return TIMDB_ERR_INVALID_ARGUMENT;
			}
		}

		else {
			set_err(err_msg, unrecognized_key(key));
			return TIMDB_ERR_INVALID_ARGUMENT;
		}
		return TIMDB_OK;
	});
}

int timdb_get_context_str(const char *key, char **output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		if (!key) {
			set_err(err_msg, "A key must be provided.");
			return TIMDB_ERR_INVALID_ARGUMENT;
		}

		if (strcmp(key, "tim_home") == 0) {
			set_output(output, timdb::Context::get_tim_home());
		} else if (strcmp(key, "log_level") == 0) {
			set_output(output, timdb::log::get_level());
		} else {
			set_err(err_msg, unrecognized_key(key));
			return TIMDB_ERR_INVALID_ARGUMENT;
		}
		return TIMDB_OK;
	});
}

int timdb_set_context_int(const char *key, const int value, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		if (!key) {
			set_err(err_msg, "A key must be provided.");
			return TIMDB_ERR_INVALID_ARGUMENT;
		}

		if (strcmp(key, "db_timeout") == 0) {
			if (value < 0) {
				set_err(err_msg, "The database timeout must not be negative.");
				return TIMDB_ERR_INVALID_ARGUMENT;
			}
			*timdb_db_timeout = value;
		}

		else {
			set_err(err_msg, unrecognized_key(key));
			return TIMDB_ERR_INVALID_ARGUMENT;
		}
		return TIMDB_OK;
	});
}

int timdb_get_context_int(const char *key, int *output, char **err_msg) {
	return guarded(__func__, err_msg, [&] {
		if (!key) {
			set_err(err_msg, "A key must be provided.");
			return TIMDB_ERR_INVALID_ARGUMENT;
		}

		if (strcmp(key, "db_timeout") == 0) {
			*output = *timdb_db_timeout;
		} else {
			set_err(err_msg, unrecognized_key(key));
			return TIMDB_ERR_INVALID_ARGUMENT;
		}
		return TIMDB_OK;
	});
}

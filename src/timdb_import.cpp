#include "timdb_import.h"

#include "schemas.h"
#include "timdb_log.h"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace timdb {
namespace import {

namespace {

std::string trim(const std::string &value) {
	const char *whitespace = " \t\r\n";
	auto start = value.find_first_not_of(whitespace);
	if (start == std::string::npos) {
		return "";
	}
	auto end = value.find_last_not_of(whitespace);
	return value.substr(start, end - start + 1);
}

/**
 * Read and parse a JSON file.
 * @return std::nullopt if the file is missing or not JSON
 */
std::optional<json> read_json_file(const std::filesystem::path &path) {
	std::error_code ec;
	if (!std::filesystem::is_regular_file(path, ec)) {
		return std::nullopt;
	}

	std::ifstream in(path);
	if (!in) {
		TIMDB_LOG_WARN("Unable to read legacy file", {log::string_field("path", path.string())});
		return std::nullopt;
	}

	try {
		return json::parse(in);
	} catch (const json::parse_error &exc) {
		TIMDB_LOG_WARN("Skipping unparsable legacy file",
					   {log::string_field("path", path.string()), log::string_field("error", exc.what())});
		return std::nullopt;
	}
}

/**
 * Validate a document against a schema.
 * @return false (after logging) if it does not conform
 */
bool conforms(const json &document, const json &schema, const std::string &what) {
	timdb_schemas::json_validator validator;
	try {
		validator.set_root_schema(schema);
		validator.validate(document);
	} catch (const std::exception &exc) {
		TIMDB_LOG_WARN("Skipping malformed legacy data",
					   {log::string_field("source", what), log::string_field("error", exc.what())});
		return false;
	}
	return true;
}

std::optional<std::string> optional_string(const json &obj, const char *key) {
	auto it = obj.find(key);
	if (it == obj.end() || !it->is_string()) {
		return std::nullopt;
	}
	return it->get<std::string>();
}

/**
 * Read a legacy plan number. Integers above INT64_MAX are held unsigned by
 * nlohmann::json and would wrap on conversion.
 * @throws std::out_of_range if the value does not fit in int64_t
 */
int64_t plan_number(const json &value) {
	if (value.is_string()) {
		return std::stoll(value.get<std::string>());
	}
	if (value.is_number_unsigned() &&
		value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
		throw std::out_of_range("Plan number " + value.dump() + " does not fit in 64 bits");
	}
	return value.get<int64_t>();
}

std::vector<std::string> subdirectories(const std::filesystem::path &root) {
	std::vector<std::string> names;
	std::error_code ec;
	if (!std::filesystem::is_directory(root, ec)) {
		return names;
	}

	for (std::filesystem::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
		std::error_code type_ec;
		if (it->is_directory(type_ec)) {
			names.push_back(it->path().filename().string());
		}
	}
	if (ec) {
		TIMDB_LOG_WARN("Error while listing legacy directory",
					   {log::string_field("path", root.string()), log::string_field("error", ec.message())});
	}
	return names;
}

std::optional<LegacyAssignmentsFile> parse_assignments_file(const std::filesystem::path &path) {
	auto parsed = read_json_file(path);
	if (!parsed || !conforms(*parsed, timdb_schemas::legacy_assignments_schema, path.string())) {
		return std::nullopt;
	}

	LegacyAssignmentsFile file;
	file.repository_id = trim((*parsed)["repositoryId"].get<std::string>());
	file.repository_remote_url = optional_string(*parsed, "repositoryRemoteUrl");
	try {
		if (parsed->contains("highestPlanId")) {
			file.highest_plan_id = plan_number((*parsed)["highestPlanId"]);
		}
		for (const auto &[plan_uuid, entry] : (*parsed)["assignments"].items()) {
			LegacyAssignment assignment;
			if (entry.contains("planId")) {
				// Older files stored the id as a numeric string
				assignment.plan_id = plan_number(entry["planId"]);
			}
			if (entry.contains("workspacePaths")) {
				assignment.workspace_paths = entry["workspacePaths"].get<std::vector<std::string>>();
			}
			if (entry.contains("workspaceOwners")) {
				assignment.workspace_owners = entry["workspaceOwners"].get<std::map<std::string, std::string>>();
			}
			if (entry.contains("users")) {
				assignment.users = entry["users"].get<std::vector<std::string>>();
			}
			assignment.status = optional_string(entry, "status");
			assignment.assigned_at = entry["assignedAt"].get<std::string>();
			assignment.updated_at = entry["updatedAt"].get<std::string>();
			file.assignments.emplace(plan_uuid, std::move(assignment));
		}
	} catch (const std::out_of_range &exc) {
		// A plan number too large for 64 bits
		TIMDB_LOG_WARN("Skipping malformed legacy data",
					   {log::string_field("source", path.string()), log::string_field("error", exc.what())});
		return std::nullopt;
	}

	return file;
}

std::optional<LegacyPermissionsFile> parse_permissions_file(const std::filesystem::path &path) {
	auto parsed = read_json_file(path);
	if (!parsed || !conforms(*parsed, timdb_schemas::legacy_permissions_schema, path.string())) {
		return std::nullopt;
	}

	LegacyPermissionsFile file;
	file.repository_id = trim((*parsed)["repositoryId"].get<std::string>());
	const auto &permissions = (*parsed)["permissions"];
	if (permissions.contains("allow")) {
		file.permissions.allow = permissions["allow"].get<std::vector<std::string>>();
	}
	if (permissions.contains("deny")) {
		file.permissions.deny = permissions["deny"].get<std::vector<std::string>>();
	}
	return file;
}

std::optional<LegacyMetadata> parse_metadata_file(const std::filesystem::path &path) {
	auto parsed = read_json_file(path);
	if (!parsed || !conforms(*parsed, timdb_schemas::legacy_metadata_schema, path.string())) {
		return std::nullopt;
	}

	LegacyMetadata metadata;
	metadata.repository_name = (*parsed)["repositoryName"].get<std::string>();
	metadata.remote_label = optional_string(*parsed, "remoteLabel");
	metadata.last_git_root = optional_string(*parsed, "lastGitRoot");
	metadata.external_config_path = optional_string(*parsed, "externalConfigPath");
	metadata.external_tasks_dir = optional_string(*parsed, "externalTasksDir");
	return metadata;
}

std::map<std::string, LegacyWorkspace> parse_workspaces_file(const std::filesystem::path &path) {
	std::map<std::string, LegacyWorkspace> workspaces;

	auto parsed = read_json_file(path);
	if (!parsed) {
		return workspaces;
	}
	if (!parsed->is_object()) {
		TIMDB_LOG_WARN("Skipping legacy workspace file that is not an object", {log::string_field("path", path.string())});
		return workspaces;
	}

	for (const auto &[workspace_path, entry] : parsed->items()) {
		if (!conforms(entry, timdb_schemas::legacy_workspace_schema, path.string() + ": " + workspace_path)) {
			continue;
		}
		if (entry["workspacePath"].get<std::string>() != workspace_path) {
			TIMDB_LOG_WARN("Skipping legacy workspace whose path does not match its key",
						   {log::string_field("path", workspace_path)});
			continue;
		}

		LegacyWorkspace workspace;
		workspace.workspace_path = workspace_path;
		workspace.task_id = entry["taskId"].get<std::string>();
		workspace.created_at = entry["createdAt"].get<std::string>();
		workspace.updated_at = optional_string(entry, "updatedAt");
		workspace.repository_id = optional_string(entry, "repositoryId");
		workspace.original_plan_file_path = optional_string(entry, "originalPlanFilePath");
		workspace.branch = optional_string(entry, "branch");
		workspace.name = optional_string(entry, "name");
		workspace.description = optional_string(entry, "description");
		workspace.plan_title = optional_string(entry, "planTitle");

		auto plan_id = entry.find("planId");
		if (plan_id != entry.end()) {
			if (plan_id->is_string()) {
				workspace.plan_id = plan_id->get<std::string>();
			} else if (plan_id->is_number_integer()) {
				workspace.plan_id = std::to_string(plan_id->get<int64_t>());
			}
		}

		auto issue_urls = entry.find("issueUrls");
		if (issue_urls != entry.end() && issue_urls->is_array()) {
			for (const auto &url : *issue_urls) {
				if (url.is_string() && !url.get<std::string>().empty()) {
					workspace.issue_urls.push_back(url.get<std::string>());
				}
			}
		}

		workspaces.emplace(workspace_path, std::move(workspace));
	}

	return workspaces;
}

/**
 * Time used to rank a workspace when collapsing multi-workspace claims.
 * Unknown workspaces and unparsable times rank lowest.
 */
double comparable_timestamp(const LegacyWorkspace *workspace) {
	if (!workspace) {
		return -std::numeric_limits<double>::infinity();
	}
	if (workspace->updated_at) {
		auto updated = parse_iso8601_ms(*workspace->updated_at);
		if (updated) {
			return static_cast<double>(*updated);
		}
	}
	auto created = parse_iso8601_ms(workspace->created_at);
	if (created) {
		return static_cast<double>(*created);
	}
	return -std::numeric_limits<double>::infinity();
}

std::optional<std::string> pick_most_recent_workspace(const std::vector<std::string> &workspace_paths,
													  const std::map<std::string, LegacyWorkspace> &workspaces) {
	if (workspace_paths.empty()) {
		return std::nullopt;
	}

	std::optional<std::string> best_path;
	double best_timestamp = -std::numeric_limits<double>::infinity();
	for (const auto &path : workspace_paths) {
		auto it = workspaces.find(path);
		double timestamp = comparable_timestamp(it == workspaces.end() ? nullptr : &it->second);
		if (timestamp > best_timestamp) {
			best_timestamp = timestamp;
			best_path = path;
		}
	}

	if (!best_path) {
		return workspace_paths.front();
	}
	return best_path;
}

ProjectDetails details_for(const LegacyRepository *repository) {
	ProjectDetails details;
	if (!repository) {
		return details;
	}
	if (repository->assignments) {
		details.remote_url = repository->assignments->repository_remote_url;
	}
	if (repository->metadata) {
		details.last_git_root = repository->metadata->last_git_root;
		details.external_config_path = repository->metadata->external_config_path;
		details.external_tasks_dir = repository->metadata->external_tasks_dir;
		details.remote_label = repository->metadata->remote_label;
	}
	return details;
}

} // namespace

LegacyData collect_legacy_data(const std::string &config_root) {
	LegacyData data;
	std::filesystem::path root(config_root);

	auto shared_root = root / "shared";
	for (const auto &repository_id : subdirectories(shared_root)) {
		auto assignments = parse_assignments_file(shared_root / repository_id / "assignments.json");
		auto permissions = parse_permissions_file(shared_root / repository_id / "permissions.json");
		if (!assignments && !permissions) {
			continue;
		}

		auto &repository = data.repositories[repository_id];
		repository.assignments = std::move(assignments);
		repository.permissions = std::move(permissions);
	}

	data.workspaces = parse_workspaces_file(root / "workspaces.json");

	auto repositories_root = root / "repositories";
	for (const auto &repository_id : subdirectories(repositories_root)) {
		auto metadata = parse_metadata_file(repositories_root / repository_id / "metadata.json");
		if (!metadata) {
			continue;
		}
		data.repositories[repository_id].metadata = std::move(metadata);
	}

	TIMDB_LOG_DEBUG("Collected legacy data", {log::string_field("root", config_root),
											   log::int_field("repositories", data.repositories.size()),
											   log::int_field("workspaces", data.workspaces.size())});
	return data;
}

ImportPlan build_import_plan(const LegacyData &data) {
	ImportPlan plan;
	std::map<std::string, size_t> project_index;

	auto seed_project = [&](const std::string &repository_id) -> ProjectSeed & {
		auto it = project_index.find(repository_id);
		if (it != project_index.end()) {
			return plan.projects[it->second];
		}
		auto repo_it = data.repositories.find(repository_id);
		ProjectSeed seed;
		seed.repository_id = repository_id;
		seed.details = details_for(repo_it == data.repositories.end() ? nullptr : &repo_it->second);
		project_index[repository_id] = plan.projects.size();
		plan.projects.push_back(seed);
		return plan.projects.back();
	};

	for (const auto &[workspace_path, workspace] : data.workspaces) {
		std::string repository_id = workspace.repository_id ? trim(*workspace.repository_id) : "";
		if (repository_id.empty()) {
			continue;
		}
		seed_project(repository_id);

		WorkspaceSeed seed;
		seed.repository_id = repository_id;
		seed.workspace.workspace_path = workspace_path;
		seed.workspace.task_id = workspace.task_id;
		seed.workspace.original_plan_file_path = workspace.original_plan_file_path;
		seed.workspace.branch = workspace.branch;
		seed.workspace.name = workspace.name;
		seed.workspace.description = workspace.description;
		seed.workspace.plan_id = workspace.plan_id;
		seed.workspace.plan_title = workspace.plan_title;
		seed.issue_urls = workspace.issue_urls;
		plan.workspaces.push_back(std::move(seed));
	}

	for (const auto &[repository_id, repository] : data.repositories) {
		auto &project = seed_project(repository_id);
		project.apply_details =
			repository.metadata.has_value() ||
			(repository.assignments.has_value() && repository.assignments->repository_remote_url.has_value());

		if (repository.permissions) {
			project.permissions = repository.permissions->permissions;
		}

		if (!repository.assignments) {
			continue;
		}
		project.highest_plan_id = repository.assignments->highest_plan_id;

		for (const auto &[plan_uuid, assignment] : repository.assignments->assignments) {
			AssignmentSeed seed;
			seed.repository_id = repository_id;
			seed.plan_uuid = plan_uuid;
			seed.plan_id = assignment.plan_id;
			seed.workspace_path = pick_most_recent_workspace(assignment.workspace_paths, data.workspaces);
			if (assignment.workspace_paths.size() > 1) {
				TIMDB_LOG_INFO("Collapsing legacy assignment to its most recent workspace",
							   {log::string_field("plan_uuid", plan_uuid),
								log::int_field("workspaces", assignment.workspace_paths.size()),
								log::string_field("kept", *seed.workspace_path)});
			}

			if (seed.workspace_path) {
				auto owner = assignment.workspace_owners.find(*seed.workspace_path);
				if (owner != assignment.workspace_owners.end()) {
					seed.claimed_by_user = owner->second;
				}
			}
			if (!seed.claimed_by_user && !assignment.users.empty()) {
				seed.claimed_by_user = assignment.users.front();
			}

			seed.status = assignment.status;
			seed.assigned_at = assignment.assigned_at;
			seed.updated_at = assignment.updated_at;
			plan.assignments.push_back(std::move(seed));
		}
	}

	return plan;
}

ImportSummary apply_import_plan(db::Database &db, const ImportPlan &plan) {
	ImportSummary summary;
	db::Transaction txn(db);

	std::map<std::string, int64_t> project_ids;
	for (const auto &seed : plan.projects) {
		auto project = Projects::get_or_create(db, seed.repository_id, seed.details);
		if (seed.apply_details) {
			Projects::update(db, project.id, seed.details);
		}
		if (seed.highest_plan_id) {
			Projects::raise_highest_plan_id(db, project.id, *seed.highest_plan_id);
		}
		if (seed.permissions) {
			Permissions::replace_all(db, project.id, *seed.permissions);
			summary.permissions += seed.permissions->allow.size() + seed.permissions->deny.size();
		}
		project_ids[seed.repository_id] = project.id;
		++summary.projects;
	}

	std::map<std::string, int64_t> workspace_ids;
	for (const auto &seed : plan.workspaces) {
		WorkspaceInput input = seed.workspace;
		input.project_id = project_ids.at(seed.repository_id);
		auto workspace = Workspaces::record(db, input);
		if (!seed.issue_urls.empty()) {
			Workspaces::set_issues(db, workspace.id, seed.issue_urls);
		}
		workspace_ids[workspace.workspace_path] = workspace.id;
		++summary.workspaces;
	}

	for (const auto &seed : plan.assignments) {
		Assignment row;
		row.project_id = project_ids.at(seed.repository_id);
		row.plan_uuid = seed.plan_uuid;
		row.plan_id = seed.plan_id;
		if (seed.workspace_path) {
			auto it = workspace_ids.find(*seed.workspace_path);
			if (it != workspace_ids.end()) {
				row.workspace_id = it->second;
			} else if (auto existing = Workspaces::get_by_path(db, *seed.workspace_path)) {
				row.workspace_id = existing->id;
			}
		}
		row.claimed_by_user = seed.claimed_by_user;
		row.status = seed.status;
		row.assigned_at = seed.assigned_at;
		row.updated_at = seed.updated_at;
		if (Assignments::import_row(db, row)) {
			++summary.assignments;
		}
	}

	txn.commit();
	return summary;
}

bool import_if_needed(db::Database &db, const std::string &config_root) {
	db::Transaction txn(db);

	bool already_imported = db::with_lock(db, [&]() {
		auto version = db.storage().get_pointer<db::SchemaVersion>(1);
		return (version && version->import_completed != 0) || db.storage().count<Project>() > 0;
	});
	if (already_imported) {
		return false;
	}

	auto plan = build_import_plan(collect_legacy_data(config_root));
	auto summary = apply_import_plan(db, plan);

	{
		auto stmt = db::prepare(txn.get(), "UPDATE schema_version SET import_completed = 1 WHERE id = 1");
		db::step(stmt.get());
	}

	txn.commit();

	TIMDB_LOG_INFO("Imported legacy JSON state",
				   {log::string_field("root", config_root), log::int_field("projects", summary.projects),
					log::int_field("workspaces", summary.workspaces), log::int_field("assignments", summary.assignments),
					log::int_field("permissions", summary.permissions)});
	return true;
}

} // namespace import
} // namespace timdb

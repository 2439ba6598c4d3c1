/**
 * Repository tests for timdb
 *
 * These tests exercise projects, workspaces, permissions and assignments
 * directly through the C++ repositories against a temporary database.
 */

#include "test_utils.h"

#include <algorithm>
#include <limits>

namespace {

using timdb::Assignments;
using timdb::Permissions;
using timdb::PermissionType;
using timdb::Projects;
using timdb::Workspaces;

class ProjectTest : public TimdbTest {};
class WorkspaceTest : public TimdbTest {};
class PermissionTest : public TimdbTest {};
class AssignmentTest : public TimdbTest {};

TEST_F(ProjectTest, GetOrCreateAndReservePlanIds) {
	auto project = Projects::get_or_create(db(), "repo-a");
	EXPECT_EQ(project.repository_id, "repo-a");
	EXPECT_EQ(project.highest_plan_id, 0);
	EXPECT_FALSE(project.remote_url);

	auto block = Projects::reserve_next_plan_id(db(), "repo-a", 0, 3);
	EXPECT_EQ(block.first, 1);
	EXPECT_EQ(block.second, 3);

	block = Projects::reserve_next_plan_id(db(), "repo-a", 0, 1);
	EXPECT_EQ(block.first, 4);
	EXPECT_EQ(block.second, 4);

	EXPECT_EQ(Projects::get(db(), "repo-a")->highest_plan_id, 4);
}

TEST_F(ProjectTest, GetOrCreateReturnsSameRow) {
	timdb::ProjectDetails details;
	details.remote_url = "https://example.com/repo-a.git";
	auto first = Projects::get_or_create(db(), "repo-a", details);
	EXPECT_EQ(first.remote_url, details.remote_url);

	// Details only apply on creation
	timdb::ProjectDetails other;
	other.remote_url = "https://example.com/elsewhere.git";
	auto second = Projects::get_or_create(db(), "repo-a", other);
	EXPECT_EQ(second.id, first.id);
	EXPECT_EQ(second.remote_url, details.remote_url);

	EXPECT_EQ(Projects::list(db()).size(), 1u);
	EXPECT_FALSE(Projects::get(db(), "repo-b"));
	EXPECT_TRUE(Projects::get_by_id(db(), first.id));
}

TEST_F(ProjectTest, ReserveHonorsLocalMaximum) {
	auto block = Projects::reserve_next_plan_id(db(), "repo-a", 10, 2);
	EXPECT_EQ(block.first, 11);
	EXPECT_EQ(block.second, 12);

	// A smaller local maximum never moves ids backwards
	block = Projects::reserve_next_plan_id(db(), "repo-a", 5, 1);
	EXPECT_EQ(block.first, 13);

	Projects::raise_highest_plan_id(db(), Projects::get(db(), "repo-a")->id, 7);
	EXPECT_EQ(Projects::get(db(), "repo-a")->highest_plan_id, 13);
}

TEST_F(ProjectTest, ReserveRejectsBadArguments) {
	try {
		Projects::reserve_next_plan_id(db(), "repo-a", 0, 0);
		FAIL() << "count 0 should be rejected";
	} catch (const timdb::Error &err) {
		EXPECT_EQ(err.code(), timdb::ErrorCode::InvalidArgument);
	}

	try {
		Projects::reserve_next_plan_id(db(), "repo-a", -1, 1);
		FAIL() << "negative maximum should be rejected";
	} catch (const timdb::Error &err) {
		EXPECT_EQ(err.code(), timdb::ErrorCode::InvalidArgument);
	}

	// Nothing was created by the rejected calls
	EXPECT_FALSE(Projects::get(db(), "repo-a"));
}

TEST_F(ProjectTest, ReserveRejectsIdsPastTheLargestInteger) {
	const int64_t largest = std::numeric_limits<int64_t>::max();

	auto block = Projects::reserve_next_plan_id(db(), "repo-a", largest - 2, 2);
	EXPECT_EQ(block.first, largest - 1);
	EXPECT_EQ(block.second, largest);

	for (int64_t local_max : {int64_t(0), largest - 1, largest}) {
		try {
			Projects::reserve_next_plan_id(db(), "repo-a", local_max, 1);
			FAIL() << "reservation past the largest id should be rejected";
		} catch (const timdb::Error &err) {
			EXPECT_EQ(err.code(), timdb::ErrorCode::InvalidArgument);
		}
	}

	// The stored value is still an exact integer
	EXPECT_EQ(Projects::get(db(), "repo-a")->highest_plan_id, largest);
	auto raw = open_sqlite3_db(db_path);
	EXPECT_EQ(query_text(raw.get(), "SELECT typeof(highest_plan_id) FROM project WHERE repository_id = 'repo-a'"),
			  "integer");

	// A fresh project whose observed maximum is already at the top is rejected without being created
	EXPECT_THROW(Projects::reserve_next_plan_id(db(), "repo-b", largest, 1), timdb::Error);
	EXPECT_FALSE(Projects::get(db(), "repo-b"));
}

TEST_F(ProjectTest, UpdateAppliesOnlyGivenFields) {
	timdb::ProjectDetails details;
	details.remote_url = "https://example.com/repo-a.git";
	details.remote_label = "origin";
	auto project = Projects::get_or_create(db(), "repo-a", details);

	timdb::ProjectUpdate update;
	update.last_git_root = "/src/repo-a";
	update.remote_label = "";
	EXPECT_TRUE(Projects::update(db(), project.id, update));

	auto updated = Projects::get_by_id(db(), project.id);
	ASSERT_TRUE(updated);
	EXPECT_EQ(updated->remote_url, details.remote_url);
	EXPECT_EQ(updated->last_git_root, std::optional<std::string>("/src/repo-a"));
	EXPECT_FALSE(updated->remote_label) << "an empty string clears the column";
	EXPECT_GE(updated->updated_at, project.updated_at);

	EXPECT_FALSE(Projects::update(db(), project.id + 1, update));
}

TEST_F(WorkspaceTest, RecordInsertsThenMerges) {
	auto project = make_project();

	timdb::WorkspaceInput input;
	input.project_id = project.id;
	input.workspace_path = "/work/one";
	input.task_id = "task-1";
	input.branch = "feature/one";
	input.plan_id = "12";
	auto created = Workspaces::record(db(), input);
	EXPECT_GT(created.id, 0);
	EXPECT_EQ(created.branch, input.branch);

	timdb::WorkspaceInput again;
	again.project_id = project.id;
	again.workspace_path = "/work/one";
	again.name = "First workspace";
	auto merged = Workspaces::record(db(), again);
	EXPECT_EQ(merged.id, created.id);
	EXPECT_EQ(merged.created_at, created.created_at);
	EXPECT_EQ(merged.branch, input.branch) << "absent fields keep their stored values";
	EXPECT_EQ(merged.task_id, input.task_id);
	EXPECT_EQ(merged.plan_id, input.plan_id);
	EXPECT_EQ(merged.name, again.name);

	EXPECT_EQ(Workspaces::find_by_project_id(db(), project.id).size(), 1u);
}

TEST_F(WorkspaceTest, Lookups) {
	auto project = make_project();
	auto other = make_project("repo-b");
	make_workspace(project.id, "/work/one", "task-1");
	make_workspace(project.id, "/work/two", "task-1");
	make_workspace(other.id, "/work/three", "task-2");

	EXPECT_EQ(Workspaces::find_by_task_id(db(), "task-1").size(), 2u);
	EXPECT_EQ(Workspaces::find_by_task_id(db(), "task-9").size(), 0u);
	EXPECT_EQ(Workspaces::find_by_project_id(db(), other.id).size(), 1u);

	auto found = Workspaces::get_by_path(db(), "/work/two");
	ASSERT_TRUE(found);
	EXPECT_EQ(found->workspace_path, "/work/two");
	EXPECT_EQ(Workspaces::get_by_id(db(), found->id)->workspace_path, "/work/two");
	EXPECT_FALSE(Workspaces::get_by_path(db(), "/work/none"));
}

TEST_F(WorkspaceTest, PatchUpdatesGivenFields) {
	auto project = make_project();
	auto workspace = make_workspace(project.id, "/work/one");

	timdb::WorkspacePatch patch;
	patch.description = "Fix the parser";
	patch.task_id = "";
	auto patched = Workspaces::patch(db(), "/work/one", patch);
	ASSERT_TRUE(patched);
	EXPECT_EQ(patched->id, workspace.id);
	EXPECT_EQ(patched->description, patch.description);
	EXPECT_FALSE(patched->task_id);

	EXPECT_FALSE(Workspaces::patch(db(), "/work/missing", patch));
}

TEST_F(WorkspaceTest, Issues) {
	auto project = make_project();
	auto workspace = make_workspace(project.id, "/work/one");

	Workspaces::set_issues(db(), workspace.id, {"https://example.com/issues/1", "https://example.com/issues/2"});
	Workspaces::add_issue(db(), workspace.id, "https://example.com/issues/2");
	Workspaces::add_issue(db(), workspace.id, "https://example.com/issues/3");

	auto issues = Workspaces::get_issues(db(), workspace.id);
	ASSERT_EQ(issues.size(), 3u);
	EXPECT_EQ(issues[0], "https://example.com/issues/1");
	EXPECT_EQ(issues[2], "https://example.com/issues/3");

	Workspaces::set_issues(db(), workspace.id, {"https://example.com/issues/4"});
	issues = Workspaces::get_issues(db(), workspace.id);
	ASSERT_EQ(issues.size(), 1u);
	EXPECT_EQ(issues[0], "https://example.com/issues/4");
}

TEST_F(WorkspaceTest, RemoveCascades) {
	auto project = make_project();
	auto workspace = make_workspace(project.id, "/work/one");
	Workspaces::add_issue(db(), workspace.id, "https://example.com/issues/1");

	timdb::LockRequest request;
	request.type = timdb::LockType::Persistent;
	request.command = "tim agent";
	timdb::WorkspaceLocks::acquire(db(), workspace.id, request);

	Assignments::claim(db(), project.id, "unclaimed", 1, workspace.id);
	Assignments::claim(db(), project.id, "claimed", 2, workspace.id, std::string("alice"));

	EXPECT_TRUE(Workspaces::remove(db(), "/work/one"));
	EXPECT_FALSE(Workspaces::remove(db(), "/work/one"));

	EXPECT_FALSE(Workspaces::get_by_path(db(), "/work/one"));
	EXPECT_TRUE(Workspaces::get_issues(db(), workspace.id).empty());
	EXPECT_FALSE(timdb::WorkspaceLocks::inspect_including_stale(db(), workspace.id));

	EXPECT_FALSE(Assignments::get(db(), project.id, "unclaimed"));
	auto kept = Assignments::get(db(), project.id, "claimed");
	ASSERT_TRUE(kept);
	EXPECT_FALSE(kept->workspace_id);
	EXPECT_FALSE(kept->workspace_path);
	EXPECT_EQ(kept->claimed_by_user, std::optional<std::string>("alice"));
}

TEST_F(PermissionTest, AddRemoveReplace) {
	auto project = make_project();

	EXPECT_TRUE(Permissions::add(db(), project.id, PermissionType::Allow, "Bash(git status)"));
	EXPECT_FALSE(Permissions::add(db(), project.id, PermissionType::Allow, "Bash(git status)"));
	EXPECT_TRUE(Permissions::add(db(), project.id, PermissionType::Deny, "Bash(rm -rf:*)"));
	// The same pattern may be both allowed and denied
	EXPECT_TRUE(Permissions::add(db(), project.id, PermissionType::Deny, "Bash(git status)"));

	auto permissions = Permissions::get(db(), project.id);
	EXPECT_EQ(permissions.allow, std::vector<std::string>({"Bash(git status)"}));
	EXPECT_EQ(permissions.deny, std::vector<std::string>({"Bash(rm -rf:*)", "Bash(git status)"}));

	EXPECT_TRUE(Permissions::remove(db(), project.id, PermissionType::Deny, "Bash(git status)"));
	EXPECT_FALSE(Permissions::remove(db(), project.id, PermissionType::Deny, "Bash(git status)"));

	timdb::PermissionSet replacement;
	replacement.allow = {"Bash(npm test)", "Bash(npm test)", "Bash(ls:*)"};
	Permissions::replace_all(db(), project.id, replacement);
	permissions = Permissions::get(db(), project.id);
	EXPECT_EQ(permissions.allow, std::vector<std::string>({"Bash(npm test)", "Bash(ls:*)"}));
	EXPECT_TRUE(permissions.deny.empty());

	auto other = make_project("repo-b");
	EXPECT_TRUE(Permissions::get(db(), other.id).allow.empty());
}

TEST_F(AssignmentTest, ClaimIsIdempotentAndReleaseDeletes) {
	auto project = make_project();
	auto workspace = make_workspace(project.id, "/work/one");

	auto first = Assignments::claim(db(), project.id, "uuid-1", 7, workspace.id, std::string("alice"));
	EXPECT_TRUE(first.created);
	EXPECT_EQ(first.assignment.plan_id, std::optional<int64_t>(7));
	EXPECT_EQ(first.assignment.workspace_id, std::optional<int64_t>(workspace.id));
	EXPECT_EQ(first.assignment.workspace_path, std::optional<std::string>("/work/one"));
	EXPECT_EQ(first.assignment.status, std::optional<std::string>("in_progress"));

	auto second = Assignments::claim(db(), project.id, "uuid-1", 7, workspace.id, std::string("alice"));
	EXPECT_FALSE(second.created);
	EXPECT_FALSE(second.updated_workspace);
	EXPECT_FALSE(second.updated_user);
	EXPECT_EQ(second.assignment.id, first.assignment.id);
	EXPECT_EQ(Assignments::list_by_project(db(), project.id).size(), 1u);

	auto released = Assignments::release(db(), project.id, "uuid-1");
	EXPECT_TRUE(released.existed);
	EXPECT_TRUE(released.removed);
	EXPECT_FALSE(Assignments::get(db(), project.id, "uuid-1"));
}

TEST_F(AssignmentTest, ReclaimKeepsStatus) {
	auto project = make_project();
	auto one = make_workspace(project.id, "/work/one");
	auto two = make_workspace(project.id, "/work/two");

	Assignments::claim(db(), project.id, "uuid-1", 7, one.id, std::string("alice"));
	exec_raw("UPDATE assignment SET status = 'blocked' WHERE plan_uuid = 'uuid-1'");

	auto moved = Assignments::claim(db(), project.id, "uuid-1", 7, two.id, std::string("bob"));
	EXPECT_FALSE(moved.created);
	EXPECT_TRUE(moved.updated_workspace);
	EXPECT_TRUE(moved.updated_user);
	EXPECT_EQ(moved.assignment.workspace_path, std::optional<std::string>("/work/two"));
	EXPECT_EQ(moved.assignment.status, std::optional<std::string>("blocked"));
}

TEST_F(AssignmentTest, PartialRelease) {
	auto project = make_project();
	auto one = make_workspace(project.id, "/work/one");
	make_workspace(project.id, "/work/two");

	Assignments::claim(db(), project.id, "uuid-1", 7, one.id, std::string("alice"));

	// Another workspace's path does not release anything
	auto result = Assignments::release(db(), project.id, "uuid-1", std::string("/work/two"), std::string("alice"));
	EXPECT_TRUE(result.existed);
	EXPECT_FALSE(result.cleared_workspace);
	EXPECT_FALSE(result.cleared_user);
	EXPECT_FALSE(result.removed);

	result = Assignments::release(db(), project.id, "uuid-1", std::string("/work/one"));
	EXPECT_TRUE(result.cleared_workspace);
	EXPECT_FALSE(result.removed);
	auto remaining = Assignments::get(db(), project.id, "uuid-1");
	ASSERT_TRUE(remaining);
	EXPECT_FALSE(remaining->workspace_id);
	EXPECT_EQ(remaining->claimed_by_user, std::optional<std::string>("alice"));

	result = Assignments::release(db(), project.id, "uuid-1", std::nullopt, std::string("bob"));
	EXPECT_FALSE(result.cleared_user);

	result = Assignments::release(db(), project.id, "uuid-1", std::nullopt, std::string("alice"));
	EXPECT_TRUE(result.cleared_user);
	EXPECT_TRUE(result.removed);
	EXPECT_FALSE(Assignments::get(db(), project.id, "uuid-1"));

	result = Assignments::release(db(), project.id, "uuid-1");
	EXPECT_FALSE(result.existed);
}

TEST_F(AssignmentTest, CleanStale) {
	auto project = make_project();
	Assignments::claim(db(), project.id, "old", 1, std::nullopt, std::string("alice"));
	Assignments::claim(db(), project.id, "new", 2, std::nullopt, std::string("alice"));
	exec_raw("UPDATE assignment SET updated_at = '2020-01-01T00:00:00.000Z' WHERE plan_uuid = 'old'");

	EXPECT_EQ(Assignments::clean_stale(db(), project.id, 7), 1);
	EXPECT_FALSE(Assignments::get(db(), project.id, "old"));
	EXPECT_TRUE(Assignments::get(db(), project.id, "new"));

	try {
		Assignments::clean_stale(db(), project.id, -1);
		FAIL() << "negative days should be rejected";
	} catch (const timdb::Error &err) {
		EXPECT_EQ(err.code(), timdb::ErrorCode::InvalidArgument);
	}
}

TEST_F(AssignmentTest, ImportRowKeepsTimestamps) {
	auto project = make_project();

	timdb::Assignment row;
	row.project_id = project.id;
	row.plan_uuid = "uuid-9";
	row.plan_id = 9;
	row.status = "pending";
	row.assigned_at = "2025-01-01T00:00:00.000Z";
	row.updated_at = "2025-01-02T00:00:00.000Z";
	EXPECT_TRUE(Assignments::import_row(db(), row));
	EXPECT_FALSE(Assignments::import_row(db(), row)) << "an existing plan is left alone";

	auto stored = Assignments::get(db(), project.id, "uuid-9");
	ASSERT_TRUE(stored);
	EXPECT_EQ(stored->assigned_at, row.assigned_at);
	EXPECT_EQ(stored->updated_at, row.updated_at);
	EXPECT_EQ(stored->status, row.status);
	EXPECT_FALSE(stored->claimed_by_user);
}

TEST(TimestampTest, ParsesIsoTimestamps) {
	EXPECT_EQ(timdb::parse_iso8601_ms("1970-01-01T00:00:01.500Z"), std::optional<int64_t>(1500));
	EXPECT_EQ(timdb::parse_iso8601_ms("1970-01-01 00:01:00Z"), std::optional<int64_t>(60000));
	EXPECT_EQ(timdb::parse_iso8601_ms("1970-01-01T01:00:00+01:00"), std::optional<int64_t>(0));
	EXPECT_FALSE(timdb::parse_iso8601_ms("yesterday"));
	EXPECT_FALSE(timdb::parse_iso8601_ms("2024-13-01T00:00:00Z"));
}

} // namespace

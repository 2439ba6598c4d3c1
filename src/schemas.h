#ifndef TIMDB_SCHEMAS_H
#define TIMDB_SCHEMAS_H

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

namespace timdb_schemas {

using json = nlohmann::json;
using json_validator = nlohmann::json_schema::json_validator;

/*
Legacy files read once by the importer
*/

inline const json legacy_assignments_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "legacy shared assignments file",
    "properties": {
        "repositoryId": {
            "type": "string",
            "minLength": 1
        },
        "repositoryRemoteUrl": {
            "type": ["string", "null"]
        },
        "version": {
            "type": "integer",
            "minimum": 0
        },
        "highestPlanId": {
            "type": "integer",
            "minimum": 0,
            "maximum": 9223372036854775807
        },
        "assignments": {
            "type": "object",
            "additionalProperties": {
                "type": "object",
                "properties": {
                    "planId": {
                        "oneOf": [
                            {"type": "integer", "minimum": 1, "maximum": 9223372036854775807},
                            {"type": "string", "pattern": "^[1-9][0-9]*$"}
                        ]
                    },
                    "workspacePaths": {
                        "type": "array",
                        "items": {"type": "string", "minLength": 1}
                    },
                    "workspaceOwners": {
                        "type": "object",
                        "additionalProperties": {"type": "string", "minLength": 1}
                    },
                    "users": {
                        "type": "array",
                        "items": {"type": "string", "minLength": 1}
                    },
                    "status": {
                        "type": "string"
                    },
                    "assignedAt": {
                        "type": "string",
                        "pattern": "^[0-9]{4}-[0-9]{2}-[0-9]{2}T"
                    },
                    "updatedAt": {
                        "type": "string",
                        "pattern": "^[0-9]{4}-[0-9]{2}-[0-9]{2}T"
                    }
                },
                "required": ["assignedAt", "updatedAt"]
            }
        }
    },
    "required": ["repositoryId", "version", "assignments"]
}
)"_json;

inline const json legacy_permissions_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "legacy shared permissions file",
    "properties": {
        "repositoryId": {
            "type": "string",
            "minLength": 1
        },
        "version": {
            "type": "integer",
            "minimum": 0
        },
        "permissions": {
            "type": "object",
            "properties": {
                "allow": {
                    "type": "array",
                    "items": {"type": "string"}
                },
                "deny": {
                    "type": "array",
                    "items": {"type": "string"}
                }
            }
        },
        "updatedAt": {
            "type": "string"
        }
    },
    "required": ["repositoryId", "version", "permissions"]
}
)"_json;

// One value of the workspaces.json map; workspacePath is checked against the key separately
inline const json legacy_workspace_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "legacy workspace entry",
    "properties": {
        "taskId": {
            "type": "string",
            "minLength": 1
        },
        "workspacePath": {
            "type": "string",
            "minLength": 1
        },
        "createdAt": {
            "type": "string",
            "minLength": 1
        }
    },
    "required": ["taskId", "workspacePath", "createdAt"]
}
)"_json;

inline const json legacy_metadata_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "legacy repository metadata file",
    "properties": {
        "repositoryName": {
            "type": "string",
            "minLength": 1
        },
        "createdAt": {
            "type": "string",
            "minLength": 1
        },
        "updatedAt": {
            "type": "string",
            "minLength": 1
        },
        "remoteLabel": {
            "type": "string"
        },
        "lastGitRoot": {
            "type": "string"
        },
        "externalConfigPath": {
            "type": "string"
        },
        "externalTasksDir": {
            "type": "string"
        }
    },
    "required": ["repositoryName", "createdAt", "updatedAt"]
}
)"_json;

/*
C API input objects
*/

inline const json project_details_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "project details obj",
    "additionalProperties": false,
    "properties": {
        "remote_url": {"type": "string"},
        "last_git_root": {"type": "string"},
        "external_config_path": {"type": "string"},
        "external_tasks_dir": {"type": "string"},
        "remote_label": {"type": "string"}
    }
}
)"_json;

inline const json workspace_record_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "workspace record obj",
    "additionalProperties": false,
    "properties": {
        "project_id": {
            "type": "integer",
            "minimum": 1
        },
        "workspace_path": {
            "type": "string",
            "minLength": 1
        },
        "task_id": {"type": "string"},
        "original_plan_file_path": {"type": "string"},
        "branch": {"type": "string"},
        "name": {"type": "string"},
        "description": {"type": "string"},
        "plan_id": {"type": "string"},
        "plan_title": {"type": "string"}
    },
    "required": ["project_id", "workspace_path"]
}
)"_json;

inline const json workspace_patch_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "workspace patch obj",
    "additionalProperties": false,
    "properties": {
        "task_id": {"type": "string"},
        "original_plan_file_path": {"type": "string"},
        "branch": {"type": "string"},
        "name": {"type": "string"},
        "description": {"type": "string"},
        "plan_id": {"type": "string"},
        "plan_title": {"type": "string"}
    }
}
)"_json;

inline const json issue_urls_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "array",
    "title": "issue url list",
    "items": {
        "type": "string",
        "minLength": 1
    }
}
)"_json;

inline const json lock_request_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "lock request obj",
    "additionalProperties": false,
    "properties": {
        "type": {
            "type": "string",
            "enum": ["persistent", "pid"]
        },
        "pid": {
            "type": "integer",
            "minimum": 1
        },
        "hostname": {"type": "string"},
        "command": {"type": "string"},
        "owner": {"type": "string", "minLength": 1}
    },
    "required": ["command"]
}
)"_json;

inline const json lock_release_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "lock release obj",
    "additionalProperties": false,
    "properties": {
        "force": {"type": "boolean"},
        "pid": {
            "type": "integer",
            "minimum": 1
        }
    }
}
)"_json;

inline const json permission_set_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "permission set obj",
    "additionalProperties": false,
    "properties": {
        "allow": {
            "type": "array",
            "items": {"type": "string", "minLength": 1}
        },
        "deny": {
            "type": "array",
            "items": {"type": "string", "minLength": 1}
        }
    }
}
)"_json;

inline const json claim_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "assignment claim obj",
    "additionalProperties": false,
    "properties": {
        "project_id": {
            "type": "integer",
            "minimum": 1
        },
        "plan_uuid": {
            "type": "string",
            "minLength": 1
        },
        "plan_id": {"type": ["integer", "null"]},
        "workspace_id": {"type": ["integer", "null"]},
        "user": {"type": ["string", "null"]}
    },
    "required": ["project_id", "plan_uuid"]
}
)"_json;

inline const json assignment_release_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "title": "assignment release obj",
    "additionalProperties": false,
    "properties": {
        "project_id": {
            "type": "integer",
            "minimum": 1
        },
        "plan_uuid": {
            "type": "string",
            "minLength": 1
        },
        "workspace_path": {"type": ["string", "null"]},
        "user": {"type": ["string", "null"]}
    },
    "required": ["project_id", "plan_uuid"]
}
)"_json;

} // namespace timdb_schemas

#endif // TIMDB_SCHEMAS_H

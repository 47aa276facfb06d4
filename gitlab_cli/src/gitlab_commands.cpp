#include "gitlab_commands.hpp"

namespace {

using M = HttpMethod;

CommandSpec list(std::string name, std::string path, std::vector<std::string> arguments, std::string summary) {
    return CommandSpec{std::move(name), M::GET, std::move(path), std::move(arguments), true, {}, std::move(summary)};
}

CommandSpec call(std::string name, M method, std::string path, std::vector<std::string> arguments,
                 std::string summary) {
    return CommandSpec{std::move(name), method, std::move(path), std::move(arguments), false, {}, std::move(summary)};
}

}

void register_gitlab_commands(CommandRegistry& registry) {
    // Instance
    registry.add(call("get_version", M::GET, "/version", {}, "Show the GitLab version"));
    registry.add(call("current_user", M::GET, "/user", {}, "Show the authenticated user"));

    // Users
    registry.add(list("get_users", "/users", {}, "List users"));
    registry.add(call("get_user", M::GET, "/users/:user_id", {"user_id"}, "Show a user"));
    registry.add(call("create_user", M::POST, "/users", {"email", "username", "name"}, "Create a user"));
    registry.add(call("edit_user", M::PUT, "/users/:user_id", {"user_id"}, "Modify a user"));
    registry.add(call("delete_user", M::DEL, "/users/:user_id", {"user_id"}, "Delete a user"));
    registry.add(call("block_user", M::POST, "/users/:user_id/block", {"user_id"}, "Block a user"));
    registry.add(call("unblock_user", M::POST, "/users/:user_id/unblock", {"user_id"}, "Unblock a user"));
    registry.add(list("get_ssh_keys", "/user/keys", {}, "List SSH keys of the current user"));
    registry.add(list("get_user_ssh_keys", "/users/:user_id/keys", {"user_id"}, "List SSH keys of a user"));
    registry.add(call("add_ssh_key", M::POST, "/user/keys", {"title", "key"}, "Add an SSH key to the current user"));
    registry.add(call("delete_ssh_key", M::DEL, "/user/keys/:key_id", {"key_id"}, "Delete an SSH key"));

    // Projects
    registry.add(list("get_projects", "/projects", {}, "List projects"));
    registry.add(list("get_user_projects", "/users/:user_id/projects", {"user_id"}, "List projects owned by a user"));
    registry.add(call("get_project", M::GET, "/projects/:id", {"id"}, "Show a project"));
    registry.add(call("create_project", M::POST, "/projects", {"name"}, "Create a project"));
    registry.add(call("edit_project", M::PUT, "/projects/:id", {"id"}, "Modify a project"));
    registry.add(call("delete_project", M::DEL, "/projects/:id", {"id"}, "Delete a project"));
    registry.add(call("fork_project", M::POST, "/projects/:id/fork", {"id"}, "Fork a project"));
    registry.add(call("archive_project", M::POST, "/projects/:id/archive", {"id"}, "Archive a project"));
    registry.add(call("unarchive_project", M::POST, "/projects/:id/unarchive", {"id"}, "Unarchive a project"));
    registry.add(CommandSpec{"search_projects", M::GET, "/search", {"search"}, true,
                             {{"scope", std::string("projects")}}, "Search projects by name"});

    // Project members
    registry.add(list("get_project_members", "/projects/:id/members", {"id"}, "List project members"));
    registry.add(call("get_project_member", M::GET, "/projects/:id/members/:user_id", {"id", "user_id"},
                      "Show a project member"));
    registry.add(call("add_project_member", M::POST, "/projects/:id/members", {"id", "user_id"},
                      "Add a member to a project"));
    registry.add(call("edit_project_member", M::PUT, "/projects/:id/members/:user_id", {"id", "user_id"},
                      "Change the access level of a project member"));
    registry.add(call("delete_project_member", M::DEL, "/projects/:id/members/:user_id", {"id", "user_id"},
                      "Remove a member from a project"));

    // Project hooks
    registry.add(list("get_project_hooks", "/projects/:id/hooks", {"id"}, "List project hooks"));
    registry.add(call("get_project_hook", M::GET, "/projects/:id/hooks/:hook_id", {"id", "hook_id"},
                      "Show a project hook"));
    registry.add(call("add_project_hook", M::POST, "/projects/:id/hooks", {"id", "url"}, "Add a project hook"));
    registry.add(call("edit_project_hook", M::PUT, "/projects/:id/hooks/:hook_id", {"id", "hook_id"},
                      "Modify a project hook"));
    registry.add(call("delete_project_hook", M::DEL, "/projects/:id/hooks/:hook_id", {"id", "hook_id"},
                      "Delete a project hook"));

    // Repository
    registry.add(list("get_branches", "/projects/:id/repository/branches", {"id"}, "List branches"));
    registry.add(call("get_branch", M::GET, "/projects/:id/repository/branches/:branch", {"id", "branch"},
                      "Show a branch"));
    registry.add(call("create_branch", M::POST, "/projects/:id/repository/branches", {"id", "branch", "ref"},
                      "Create a branch"));
    registry.add(call("delete_branch", M::DEL, "/projects/:id/repository/branches/:branch", {"id", "branch"},
                      "Delete a branch"));
    registry.add(list("get_protected_branches", "/projects/:id/protected_branches", {"id"},
                      "List protected branches"));
    registry.add(call("protect_branch", M::POST, "/projects/:id/protected_branches", {"id", "name"},
                      "Protect a branch"));
    registry.add(call("unprotect_branch", M::DEL, "/projects/:id/protected_branches/:name", {"id", "name"},
                      "Unprotect a branch"));
    registry.add(list("get_tags", "/projects/:id/repository/tags", {"id"}, "List tags"));
    registry.add(call("create_tag", M::POST, "/projects/:id/repository/tags", {"id", "tag_name", "ref"},
                      "Create a tag"));
    registry.add(call("delete_tag", M::DEL, "/projects/:id/repository/tags/:tag_name", {"id", "tag_name"},
                      "Delete a tag"));
    registry.add(list("get_commits", "/projects/:id/repository/commits", {"id"}, "List commits"));
    registry.add(call("get_commit", M::GET, "/projects/:id/repository/commits/:sha", {"id", "sha"},
                      "Show a commit"));
    registry.add(call("get_commit_diff", M::GET, "/projects/:id/repository/commits/:sha/diff", {"id", "sha"},
                      "Show the diff of a commit"));
    registry.add(list("get_repository_tree", "/projects/:id/repository/tree", {"id"},
                      "List files in the repository"));

    // Issues
    registry.add(list("get_issues", "/issues", {}, "List issues of the current user"));
    registry.add(list("get_project_issues", "/projects/:id/issues", {"id"}, "List project issues"));
    registry.add(call("get_project_issue", M::GET, "/projects/:id/issues/:issue_iid", {"id", "issue_iid"},
                      "Show a project issue"));
    registry.add(call("create_issue", M::POST, "/projects/:id/issues", {"id", "title"}, "Create an issue"));
    registry.add(call("edit_issue", M::PUT, "/projects/:id/issues/:issue_iid", {"id", "issue_iid"},
                      "Modify an issue"));
    registry.add(list("get_issue_notes", "/projects/:id/issues/:issue_iid/notes", {"id", "issue_iid"},
                      "List comments on an issue"));
    registry.add(call("create_issue_note", M::POST, "/projects/:id/issues/:issue_iid/notes",
                      {"id", "issue_iid", "body"}, "Comment on an issue"));

    // Merge requests
    registry.add(list("get_merge_requests", "/projects/:id/merge_requests", {"id"}, "List merge requests"));
    registry.add(call("get_merge_request", M::GET, "/projects/:id/merge_requests/:merge_request_iid",
                      {"id", "merge_request_iid"}, "Show a merge request"));
    registry.add(call("create_merge_request", M::POST, "/projects/:id/merge_requests",
                      {"id", "source_branch", "target_branch", "title"}, "Open a merge request"));
    registry.add(call("edit_merge_request", M::PUT, "/projects/:id/merge_requests/:merge_request_iid",
                      {"id", "merge_request_iid"}, "Modify a merge request"));
    registry.add(call("accept_merge_request", M::PUT, "/projects/:id/merge_requests/:merge_request_iid/merge",
                      {"id", "merge_request_iid"}, "Merge a merge request"));
    registry.add(list("get_merge_request_notes", "/projects/:id/merge_requests/:merge_request_iid/notes",
                      {"id", "merge_request_iid"}, "List comments on a merge request"));
    registry.add(call("create_merge_request_note", M::POST,
                      "/projects/:id/merge_requests/:merge_request_iid/notes",
                      {"id", "merge_request_iid", "body"}, "Comment on a merge request"));

    // Milestones and labels
    registry.add(list("get_milestones", "/projects/:id/milestones", {"id"}, "List milestones"));
    registry.add(call("get_milestone", M::GET, "/projects/:id/milestones/:milestone_id", {"id", "milestone_id"},
                      "Show a milestone"));
    registry.add(call("create_milestone", M::POST, "/projects/:id/milestones", {"id", "title"},
                      "Create a milestone"));
    registry.add(call("edit_milestone", M::PUT, "/projects/:id/milestones/:milestone_id", {"id", "milestone_id"},
                      "Modify a milestone"));
    registry.add(list("get_labels", "/projects/:id/labels", {"id"}, "List labels"));
    registry.add(call("create_label", M::POST, "/projects/:id/labels", {"id", "name", "color"},
                      "Create a label"));
    registry.add(call("delete_label", M::DEL, "/projects/:id/labels/:name", {"id", "name"}, "Delete a label"));

    // Groups
    registry.add(list("get_groups", "/groups", {}, "List groups"));
    registry.add(call("get_group", M::GET, "/groups/:id", {"id"}, "Show a group"));
    registry.add(call("create_group", M::POST, "/groups", {"name", "path"}, "Create a group"));
    registry.add(call("edit_group", M::PUT, "/groups/:id", {"id"}, "Modify a group"));
    registry.add(call("delete_group", M::DEL, "/groups/:id", {"id"}, "Delete a group"));
    registry.add(list("get_group_projects", "/groups/:id/projects", {"id"}, "List projects of a group"));
    registry.add(list("get_group_members", "/groups/:id/members", {"id"}, "List group members"));
    registry.add(call("add_group_member", M::POST, "/groups/:id/members", {"id", "user_id"},
                      "Add a member to a group"));
    registry.add(call("edit_group_member", M::PUT, "/groups/:id/members/:user_id", {"id", "user_id"},
                      "Change the access level of a group member"));
    registry.add(call("delete_group_member", M::DEL, "/groups/:id/members/:user_id", {"id", "user_id"},
                      "Remove a member from a group"));

    // Namespaces
    registry.add(list("get_namespaces", "/namespaces", {}, "List namespaces"));
}

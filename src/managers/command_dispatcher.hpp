#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <platform/process.hpp>

class ExtensionRegistry;
class ProjectRegistry;

// What an extension learns about its caller through the environment.
struct DispatchContext {
    std::optional<std::string> project_id;     // PM_CURRENT_PROJECT, unset when none
    std::optional<std::string> project_path;   // PM_CURRENT_PROJECT_PATH
    std::string config_path;                   // PM_CONFIG_PATH
    std::string tool_version;                  // PM_VERSION
};

// Derive the current project from cwd (deepest registered ancestor).
// An unreadable config just means "no current project".
DispatchContext make_context(const ProjectRegistry& projects, const std::string& cwd,
                             const std::string& config_path);

// Environment handed to the child. Variables listed in unset must be removed.
platform::SpawnOptions build_spawn_options(const InstalledExtension& extension,
                                           const std::vector<std::string>& args,
                                           const DispatchContext& context);

// Run the extension's entry point with args (command name first), inheriting
// stdio, forwarding SIGINT/SIGTERM/SIGHUP/SIGQUIT, and wait for it.
// Fails with ErrorKind::Spawn only when the process could not be started.
Result<platform::ExitStatus> invoke(const InstalledExtension& extension,
                                    const std::vector<std::string>& args,
                                    const DispatchContext& context);

// Exit code of a finished child: its own code, or 125 if it died from a signal.
int exit_code_for(const platform::ExitStatus& status);

// Resolve `extension` (exact or unique prefix), fall back to the raw entry
// point for undeclared commands, invoke, and map the outcome to pm's exit code
// (126 when the extension could not be started, 1 when it is not installed).
int dispatch(const ExtensionRegistry& registry, const std::string& extension,
             const std::vector<std::string>& args, const DispatchContext& context,
             std::string* error = nullptr);

#include "command_dispatcher.hpp"
#include "extension_registry.hpp"
#include "project_registry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

DispatchContext make_context(const ProjectRegistry& projects, const std::string& cwd,
                             const std::string& config_path) {
    DispatchContext ctx;
    ctx.config_path = config_path;
    ctx.tool_version = PM_VERSION;

    auto current = projects.find_containing(cwd);
    if (current.is_err()) {
        pm_log("dispatch: no project context: " + current.error);
        return ctx;
    }
    if (current.value) {
        ctx.project_id = current.value->id;
        ctx.project_path = current.value->path;
    }
    return ctx;
}

platform::SpawnOptions build_spawn_options(const InstalledExtension& extension,
                                           const std::vector<std::string>& args,
                                           const DispatchContext& context) {
    platform::SpawnOptions opts;
    opts.env[ENV_CONFIG_PATH] = context.config_path;
    opts.env[ENV_VERSION] = context.tool_version;
    opts.env[ENV_EXTENSION_DIR] = extension.directory;
    opts.env[ENV_EXTENSION_NAME] = extension.name;

    if (context.project_id) {
        opts.env[ENV_CURRENT_PROJECT] = *context.project_id;
    } else {
        opts.unset_env.push_back(ENV_CURRENT_PROJECT);
    }
    if (context.project_path) {
        opts.env[ENV_CURRENT_PROJECT_PATH] = *context.project_path;
    } else {
        opts.unset_env.push_back(ENV_CURRENT_PROJECT_PATH);
    }
    if (!args.empty()) {
        opts.env[ENV_COMMAND_NAME] = args[0];
    } else {
        opts.unset_env.push_back(ENV_COMMAND_NAME);
    }
    return opts;
}

Result<platform::ExitStatus> invoke(const InstalledExtension& extension,
                                    const std::vector<std::string>& args,
                                    const DispatchContext& context) {
    pm_log(fmt::format("dispatch: {} {} ({} arg(s))", extension.name,
                       args.empty() ? "<none>" : args[0], args.size()));

    platform::ExitStatus status;
    {
        platform::SignalForwarder forward;
        auto child = platform::spawn(extension.binary_path, args,
                                     build_spawn_options(extension, args, context));
        if (child.is_err()) {
            pm_log("dispatch: " + child.error);
            return Result<platform::ExitStatus>::Err(child);
        }
        forward.attach(child.value);
        status = child.value.wait_status();
    }

    if (status.exited) {
        pm_log(fmt::format("dispatch: {} exited {}", extension.name, status.code));
    } else {
        pm_log(fmt::format("dispatch: {} killed by signal {}", extension.name, status.signal));
    }
    return Result<platform::ExitStatus>::Ok(status);
}

int exit_code_for(const platform::ExitStatus& status) {
    return status.exited ? status.code : EXIT_CHILD_SIGNALED;
}

int dispatch(const ExtensionRegistry& registry, const std::string& extension,
             const std::vector<std::string>& args, const DispatchContext& context,
             std::string* error) {
    auto ext = registry.resolve_prefix(extension);
    if (ext.is_err()) {
        if (error) *error = ext.error;
        return EXIT_FAILURE_CODE;
    }

    if (!args.empty()) {
        auto cmd = registry.resolve_command(ext.value.name, args[0]);
        if (cmd.is_err() && cmd.kind == ErrorKind::CommandNotFound) {
            pm_log("dispatch: " + cmd.error + ", passing arguments through");
        }
    }

    auto status = invoke(ext.value, args, context);
    if (status.is_err()) {
        if (error) *error = status.error;
        return EXIT_SPAWN_FAILED;
    }
    return exit_code_for(status.value);
}

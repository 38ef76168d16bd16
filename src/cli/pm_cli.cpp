#include "pm_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <core/log.hpp>
#include <managers/project_registry.hpp>
#include <managers/extension_installer.hpp>
#include <managers/extension_registry.hpp>
#include <managers/command_dispatcher.hpp>
#include <platform/http.hpp>
#include <platform/target.hpp>
#include <fmt/format.h>
#include <iostream>
#include <map>

namespace fs = std::filesystem;

namespace {

// Split "--flag value" options out of args; the rest stay positional.
struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::vector<std::string> switches;

    bool has(const std::string& s) const {
        for (const auto& x : switches) if (x == s) return true;
        return false;
    }
    std::string option(const std::string& key, const std::string& fallback = "") const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }
};

ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::vector<std::string>& valued,
                      const std::vector<std::string>& flags = {}) {
    ParsedArgs out;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        bool matched = false;
        for (const auto& v : valued) {
            if (a == v && i + 1 < args.size()) {
                out.options[v] = args[++i];
                matched = true;
                break;
            }
        }
        if (matched) continue;
        for (const auto& f : flags) {
            if (a == f) {
                out.switches.push_back(f);
                matched = true;
                break;
            }
        }
        if (!matched) out.positional.push_back(a);
    }
    return out;
}

int report(const std::string& error, ErrorKind kind) {
    std::cerr << theme::fail(fmt::format("{} ({})", error, error_kind_name(kind)));
    return EXIT_FAILURE_CODE;
}

std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (const auto& s : v) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

} // namespace

PmCLI::PmCLI() : PmCLI(get_config_path(), get_extensions_dir()) {}

PmCLI::PmCLI(fs::path config_path, fs::path extensions_dir)
    : store_(std::move(config_path)), extensions_dir_(std::move(extensions_dir)) {}

void PmCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Projects");
    std::cout << theme::usage("pm init", "[github_user] [root]", "Create the config file");
    std::cout << theme::usage("pm add", "<path> [tags...]", "Register a project directory");
    std::cout << theme::usage("pm rm", "<id|name>", "Unregister a project");
    std::cout << theme::usage("pm ls", "[tag]", "List projects");
    std::cout << theme::usage("pm tag", "<id|name> <tags...>", "Add tags (--remove, --set)");
    std::cout << theme::usage("pm switch", "<query>", "Print a project path, record access");
    std::cout << theme::usage("pm prune", "", "Drop usage stats of removed projects");
    std::cout << theme::usage("pm config show", "", "Show the configuration");
    std::cout << theme::usage("pm config list", "", "List settable keys and values");
    std::cout << theme::usage("pm config get", "<key>", "Print one value");
    std::cout << theme::usage("pm config set", "<key> <value>", "Change one value");
    std::cout << theme::usage("pm config validate", "", "Check the config file");
    std::cout << theme::usage("pm config reset", "[--yes]", "Restore defaults, keep a backup");
    std::cout << theme::section("Extensions");
    std::cout << theme::usage("pm ext install", "<name> [version]", "--source <path|url> --repo --target");
    std::cout << theme::usage("pm ext uninstall", "<name>", "Remove an extension");
    std::cout << theme::usage("pm ext list", "", "List installed extensions");
    std::cout << theme::usage("pm ext pack", "<dir>", "Build a release archive (--target --out)");
    std::cout << theme::usage("pm", "<extension> [command] [args...]", "Run an extension");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    pm --version          Show version\n"
              << "    pm --help             Show this help"
              << theme::color::RESET << "\n\n";
}

int PmCLI::run(const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "--help" || args[0] == "-h" || args[0] == "help") {
        print_usage();
        return EXIT_OK;
    }

    const std::string& cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());
    pm_log("cli: " + join(args, " "));

    if (cmd == "--version") {
        std::cout << PM_TOOL_NAME << " " << PM_VERSION << "\n";
        return EXIT_OK;
    }
    if (cmd == "init")   return run_init(rest);
    if (cmd == "add")    return run_add(rest);
    if (cmd == "rm")     return run_remove(rest);
    if (cmd == "ls")     return run_list(rest);
    if (cmd == "tag")    return run_tag(rest);
    if (cmd == "switch") return run_switch(rest);
    if (cmd == "prune")  return run_prune(rest);
    if (cmd == "config") return run_config(rest);
    if (cmd == "ext")    return run_ext(rest);
    return run_dispatch(cmd, rest);
}

std::string PmCLI::github_username() const {
    auto config = store_.load();
    return config.is_ok() ? config.value.github_username : "";
}

// ── Projects ─────────────────────────────────────────────────

int PmCLI::run_init(const std::vector<std::string>& args) {
    std::string user = args.size() > 0 ? args[0] : "";
    std::string root = args.size() > 1 ? args[1] : "";

    auto created = store_.create_default(user, root);
    if (created.is_err()) return report(created.error, created.kind);

    std::cout << theme::ok("Created " + store_.path().string());
    std::cout << theme::kv("Root", created.value.projects_root_dir);
    std::cout << theme::kv("Editor", created.value.editor);
    if (!user.empty()) std::cout << theme::kv("GitHub", user);
    return EXIT_OK;
}

int PmCLI::run_add(const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {"--name"});
    if (parsed.positional.empty()) {
        std::cerr << theme::fail("Missing project path.");
        std::cerr << theme::step("Usage: pm add <path> [tags...] [--name <name>]");
        return EXIT_FAILURE_CODE;
    }

    ProjectRegistry registry(store_);
    std::vector<std::string> tags(parsed.positional.begin() + 1, parsed.positional.end());
    auto added = registry.add(parsed.positional[0], tags, parsed.option("--name"));
    if (added.is_err()) return report(added.error, added.kind);

    std::cout << theme::ok("Added " + theme::bold(added.value.name));
    std::cout << theme::kv("Id", added.value.id);
    std::cout << theme::kv("Path", added.value.path);
    if (!added.value.tags.empty()) std::cout << theme::kv("Tags", join(added.value.tags, ", "));
    return EXIT_OK;
}

int PmCLI::run_remove(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << theme::fail("Usage: pm rm <id|name>");
        return EXIT_FAILURE_CODE;
    }

    ProjectRegistry registry(store_);
    auto project = registry.resolve(args[0]);
    if (project.is_err()) return report(project.error, project.kind);

    auto removed = registry.remove(project.value.id);
    if (removed.is_err()) return report(removed.error, removed.kind);

    std::cout << theme::ok("Removed " + project.value.name);
    return EXIT_OK;
}

int PmCLI::run_list(const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {"--sort", "--limit", "--language"});

    ProjectFilter filter;
    filter.machine_id = get_machine_id();
    if (!parsed.positional.empty()) filter.tag = parsed.positional[0];
    if (!parsed.option("--language").empty()) filter.language = parsed.option("--language");

    std::string sort = parsed.option("--sort", "updated");
    if (sort == "name") filter.order = ProjectOrder::Name;
    else if (sort == "accessed") filter.order = ProjectOrder::LastAccessed;
    else if (sort == "count") filter.order = ProjectOrder::AccessCount;
    else if (sort != "updated") {
        std::cerr << theme::fail("Unknown sort order: " + sort);
        std::cerr << theme::step("Use one of: updated, name, accessed, count");
        return EXIT_FAILURE_CODE;
    }

    auto config = store_.load();
    if (config.is_err()) return report(config.error, config.kind);
    int limit = safe_stoi(parsed.option("--limit"), config.value.settings.recent_projects_limit);
    if (limit > 0) filter.limit = static_cast<size_t>(limit);

    ProjectRegistry registry(store_);
    auto projects = registry.list(filter);
    if (projects.is_err()) return report(projects.error, projects.kind);

    if (projects.value.empty()) {
        std::cout << theme::info(filter.tag ? "No projects tagged " + *filter.tag : "No projects yet (pm add <path>)");
        return EXIT_OK;
    }

    std::cout << "\n";
    for (const auto& p : projects.value) {
        AccessInfo access = access_info_in(config.value, p.id, filter.machine_id);
        std::string seen = access.last_accessed ? format_time_ago(*access.last_accessed) : "-";
        std::cout << fmt::format("    {:<24} ", p.name)
                  << theme::dim(fmt::format("{:<10}", seen))
                  << p.path;
        if (!p.tags.empty()) std::cout << "  " << theme::teal("[" + join(p.tags, ", ") + "]");
        std::cout << "\n";
    }
    std::cout << "\n";
    return EXIT_OK;
}

int PmCLI::run_tag(const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {}, {"--remove", "--set"});
    if (parsed.positional.size() < 2 && !parsed.has("--set")) {
        std::cerr << theme::fail("Usage: pm tag <id|name> <tags...> [--remove | --set]");
        return EXIT_FAILURE_CODE;
    }
    if (parsed.positional.empty()) {
        std::cerr << theme::fail("Missing project.");
        return EXIT_FAILURE_CODE;
    }

    ProjectRegistry registry(store_);
    auto project = registry.resolve(parsed.positional[0]);
    if (project.is_err()) return report(project.error, project.kind);

    std::vector<std::string> tags(parsed.positional.begin() + 1, parsed.positional.end());
    Result<ProjectEntry> updated = parsed.has("--set")    ? registry.update_tags(project.value.id, tags)
                                 : parsed.has("--remove") ? registry.remove_tags(project.value.id, tags)
                                                          : registry.add_tags(project.value.id, tags);
    if (updated.is_err()) return report(updated.error, updated.kind);

    std::cout << theme::ok(fmt::format("{}: {}", updated.value.name,
        updated.value.tags.empty() ? std::string("(no tags)") : join(updated.value.tags, ", ")));
    return EXIT_OK;
}

int PmCLI::run_switch(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << theme::fail("Usage: pm switch <query>");
        return EXIT_FAILURE_CODE;
    }

    ProjectRegistry registry(store_);
    std::string machine = get_machine_id();

    // Exact id/name first, then best prefix match
    auto exact = registry.resolve(args[0]);
    ProjectEntry target;
    if (exact.is_ok()) {
        target = exact.value;
    } else {
        auto matches = registry.find_by_path_prefix(args[0], machine);
        if (matches.is_err()) return report(matches.error, matches.kind);
        if (matches.value.empty()) return report("No project matches " + args[0], ErrorKind::NotFound);
        target = matches.value.front();
        if (matches.value.size() > 1) {
            std::cerr << theme::info(fmt::format("{} matches, using the most used", matches.value.size()));
        }
    }

    auto touched = registry.touch(target.id, machine);
    if (touched.is_err()) return report(touched.error, touched.kind);

    std::cerr << theme::ok("Switched to " + theme::bold(target.name));
    std::cout << target.path << "\n";
    return EXIT_OK;
}

int PmCLI::run_prune(const std::vector<std::string>&) {
    ProjectRegistry registry(store_);
    auto pruned = registry.prune_orphaned_stats();
    if (pruned.is_err()) return report(pruned.error, pruned.kind);
    std::cout << theme::ok(fmt::format("Pruned {} orphaned usage record(s)", pruned.value));
    return EXIT_OK;
}

// ── Configuration ────────────────────────────────────────────

int PmCLI::run_config(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << theme::fail("Usage: pm config <show|list|get|set|validate|reset> ...");
        return EXIT_FAILURE_CODE;
    }
    std::vector<std::string> rest(args.begin() + 1, args.end());
    if (args[0] == "show")     return config_show();
    if (args[0] == "list")     return config_list();
    if (args[0] == "get")      return config_get(rest);
    if (args[0] == "set")      return config_set(rest);
    if (args[0] == "validate") return config_validate();
    if (args[0] == "reset")    return config_reset(rest);

    std::cerr << theme::fail("Unknown config command: " + args[0]);
    return EXIT_FAILURE_CODE;
}

int PmCLI::config_show() {
    auto config = store_.load();
    if (config.is_err()) return report(config.error, config.kind);
    const ConfigDocument& c = config.value;

    auto flag = [](bool b) { return b ? theme::teal("enabled") : theme::dim("disabled"); };
    std::cout << theme::section("Configuration");
    std::cout << theme::kv("Version", c.version);
    std::cout << theme::kv("GitHub", c.github_username.empty() ? theme::dim("(not set)") : c.github_username);
    std::cout << theme::kv("Root", c.projects_root_dir);
    std::cout << theme::kv("Editor", c.editor);
    std::cout << theme::kv("Auto open", flag(c.settings.auto_open_editor));
    std::cout << theme::kv("Git status", flag(c.settings.show_git_status));
    std::cout << theme::kv("Recent", fmt::format("{} projects", c.settings.recent_projects_limit));
    std::cout << theme::kv("Projects", std::to_string(c.projects.size()));
    std::cout << "\n" << theme::dim("    " + store_.path().string()) << "\n\n";
    return EXIT_OK;
}

int PmCLI::config_list() {
    auto config = store_.load();
    if (config.is_err()) return report(config.error, config.kind);

    std::cout << "\n";
    for (const auto& k : config_keys()) {
        auto value = config_value(config.value, k.key);
        std::cout << fmt::format("    {:<34} {:<24} ", k.key, value.value)
                  << theme::dim(fmt::format("({}{})", k.type, k.writable ? "" : ", read-only")) << "\n";
    }
    std::cout << "\n";
    return EXIT_OK;
}

int PmCLI::config_get(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << theme::fail("Usage: pm config get <key>");
        return EXIT_FAILURE_CODE;
    }
    auto value = store_.get(args[0]);
    if (value.is_err()) {
        int code = report(value.error, value.kind);
        if (value.kind == ErrorKind::NotFound && store_.exists()) {
            std::cerr << theme::step("See 'pm config list' for the available keys");
        }
        return code;
    }
    std::cout << value.value << "\n";
    return EXIT_OK;
}

int PmCLI::config_set(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << theme::fail("Usage: pm config set <key> <value>");
        return EXIT_FAILURE_CODE;
    }
    auto previous = store_.set(args[0], args[1]);
    if (previous.is_err()) return report(previous.error, previous.kind);

    std::cout << theme::ok(fmt::format("{}: {} -> {}", args[0],
                                       previous.value.empty() ? "(empty)" : previous.value, args[1]));
    return EXIT_OK;
}

int PmCLI::config_validate() {
    auto checked = store_.validate();
    if (checked.is_err()) return report(checked.error, checked.kind);

    std::cout << theme::ok("Configuration is valid");
    for (const auto& w : checked.value) std::cout << theme::warn(w);
    return EXIT_OK;
}

int PmCLI::config_reset(const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {}, {"--yes", "-y"});
    if (!parsed.has("--yes") && !parsed.has("-y") && store_.exists()) {
        std::cout << theme::warn("This replaces " + store_.path().string() + " with defaults.");
        std::cout << "    Continue? (y/N): " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        if (answer.empty() || (answer[0] != 'y' && answer[0] != 'Y')) {
            std::cout << theme::info("Cancelled");
            return EXIT_OK;
        }
    }

    auto backup = store_.reset();
    if (backup.is_err()) return report(backup.error, backup.kind);

    if (!backup.value.empty()) std::cout << theme::kv("Backup", backup.value.string());
    std::cout << theme::ok("Configuration reset to defaults");
    std::cout << theme::step("Run 'pm config set github_username <name>' to set your account");
    return EXIT_OK;
}

// ── Extensions ───────────────────────────────────────────────

int PmCLI::run_ext(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << theme::fail("Usage: pm ext <install|uninstall|list|pack> ...");
        return EXIT_FAILURE_CODE;
    }
    std::vector<std::string> rest(args.begin() + 1, args.end());
    if (args[0] == "install")   return ext_install(rest);
    if (args[0] == "uninstall") return ext_uninstall(rest);
    if (args[0] == "list")      return ext_list();
    if (args[0] == "pack")      return ext_pack(rest);

    std::cerr << theme::fail("Unknown ext command: " + args[0]);
    return EXIT_FAILURE_CODE;
}

int PmCLI::ext_install(const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {"--source", "--repo", "--target"});
    if (parsed.positional.empty()) {
        std::cerr << theme::fail("Usage: pm ext install <name> [version] [--source <path|url>]");
        return EXIT_FAILURE_CODE;
    }

    InstallRequest request;
    request.name = parsed.positional[0];
    request.version = parsed.positional.size() > 1 ? parsed.positional[1] : "";
    request.source = parsed.option("--source");
    request.repository = parsed.option("--repo");
    request.target = parsed.option("--target");
    if (request.source.empty() && request.version.empty()) request.version = PM_VERSION;

    platform::CurlFetcher fetcher([](const std::string& msg) { std::cout << theme::step(msg); });
    ExtensionInstaller installer(extensions_dir_, fetcher, github_username(),
                                 [](const std::string& msg) { std::cout << theme::step(msg); });

    auto installed = installer.install(request);
    if (installed.is_err()) return report(installed.error, installed.kind);

    std::cout << theme::ok(fmt::format("{} v{} installed", installed.value.name,
                                       installed.value.manifest.version));
    for (const auto& c : installed.value.manifest.commands) {
        std::cout << theme::kv(c.name, c.help);
    }
    return EXIT_OK;
}

int PmCLI::ext_uninstall(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << theme::fail("Usage: pm ext uninstall <name>");
        return EXIT_FAILURE_CODE;
    }

    platform::CurlFetcher fetcher;
    ExtensionInstaller installer(extensions_dir_, fetcher);
    auto removed = installer.uninstall(args[0]);
    if (removed.is_err()) return report(removed.error, removed.kind);

    std::cout << theme::ok("Uninstalled " + args[0]);
    return EXIT_OK;
}

int PmCLI::ext_list() {
    auto registry = ExtensionRegistry::scan(extensions_dir_);
    for (const auto& w : registry.warnings()) std::cerr << theme::warn(w);

    if (registry.extensions().empty()) {
        std::cout << theme::info("No extensions installed");
        return EXIT_OK;
    }

    std::cout << "\n";
    for (const auto& [name, ext] : registry.extensions()) {
        std::cout << fmt::format("    {:<16} ", name)
                  << theme::dim(fmt::format("v{:<10}", ext.manifest.version))
                  << ext.manifest.description << "\n";
        for (const auto& c : ext.manifest.commands) {
            std::cout << theme::dim(fmt::format("      {:<14} {}", c.name, c.help)) << "\n";
        }
    }
    std::cout << "\n";
    return EXIT_OK;
}

int PmCLI::ext_pack(const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {"--target", "--out"});
    if (parsed.positional.empty()) {
        std::cerr << theme::fail("Usage: pm ext pack <dir> [--target <triple>] [--out <dir>]");
        return EXIT_FAILURE_CODE;
    }

    std::string target = parsed.option("--target");
    if (target.empty()) {
        auto current = platform::current_target();
        if (current.is_err()) return report(current.error, current.kind);
        target = current.value;
    }

    auto packed = ExtensionInstaller::pack(parsed.positional[0], target,
                                           parsed.option("--out", fs::current_path().string()));
    if (packed.is_err()) return report(packed.error, packed.kind);

    std::cout << theme::ok("Wrote " + packed.value.string());
    return EXIT_OK;
}

int PmCLI::run_dispatch(const std::string& extension, const std::vector<std::string>& args) {
    auto registry = ExtensionRegistry::scan(extensions_dir_);
    for (const auto& w : registry.warnings()) std::cerr << theme::warn(w);

    std::error_code ec;
    std::string cwd = fs::current_path(ec).string();
    DispatchContext context = make_context(ProjectRegistry(store_), cwd, store_.path().string());

    std::string error;
    int code = dispatch(registry, extension, args, context, &error);
    if (!error.empty()) {
        std::cerr << theme::fail(error);
        if (code == EXIT_FAILURE_CODE) std::cerr << theme::step("Run 'pm --help' for commands");
    }
    return code;
}

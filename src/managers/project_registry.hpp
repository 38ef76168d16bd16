#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>

enum class ProjectOrder {
    UpdatedAt,      // most recently updated first (default)
    Name,
    LastAccessed,   // on ProjectFilter::machine_id
    AccessCount,    // on ProjectFilter::machine_id
};

struct ProjectFilter {
    std::optional<std::string> tag;
    std::optional<std::string> language;
    ProjectOrder order = ProjectOrder::UpdatedAt;
    std::optional<size_t> limit;
    std::string machine_id;   // used by the access-based orders
};

struct AccessInfo {
    std::optional<std::string> last_accessed;
    int64_t count = 0;
};

struct OrphanedStat {
    std::string machine_id;
    std::string project_id;
};

// CRUD and queries over the projects of one configuration file.
// Mutations run lock -> load -> apply -> validate -> save; queries load fresh.
class ProjectRegistry {
public:
    explicit ProjectRegistry(ConfigStore store);

    // Register an existing directory. Name defaults to its basename.
    Result<ProjectEntry> add(const std::string& path,
                             const std::vector<std::string>& tags = {},
                             const std::string& name = "");

    // Usage stats referencing the project are left behind as orphans.
    Result<void> remove(const std::string& id);

    Result<ProjectEntry> update_tags(const std::string& id, const std::vector<std::string>& tags);
    Result<ProjectEntry> add_tags(const std::string& id, const std::vector<std::string>& tags);
    Result<ProjectEntry> remove_tags(const std::string& id, const std::vector<std::string>& tags);

    // Record an access from machine_id. Leaves updated_at alone.
    Result<void> touch(const std::string& id, const std::string& machine_id);

    Result<ProjectEntry> get(const std::string& id) const;
    Result<ProjectEntry> find_by_name(const std::string& name) const;

    // Full id, exact name, or unique id prefix.
    Result<ProjectEntry> resolve(const std::string& id_or_name) const;

    // Project whose directory is the deepest ancestor of (or equal to) path.
    Result<std::optional<ProjectEntry>> find_containing(const std::string& path) const;

    Result<std::vector<ProjectEntry>> list(const ProjectFilter& filter = ProjectFilter{}) const;

    // Path prefix match for absolute queries, name prefix match otherwise.
    // Most used on machine_id first.
    Result<std::vector<ProjectEntry>> find_by_path_prefix(const std::string& query,
                                                          const std::string& machine_id) const;

    Result<AccessInfo> access_info(const std::string& id, const std::string& machine_id) const;

    // Stats whose project no longer exists. Never cleaned up implicitly.
    Result<std::vector<OrphanedStat>> orphaned_stats() const;
    Result<size_t> prune_orphaned_stats();

    const ConfigStore& store() const { return store_; }

private:
    template <typename T, typename Fn>
    Result<T> mutate(Fn&& apply);

    ConfigStore store_;
};

// Usage of one project on machine_id within an already loaded document.
AccessInfo access_info_in(const ConfigDocument& config, const std::string& id,
                          const std::string& machine_id);

// Drop duplicates, keeping the first occurrence.
std::vector<std::string> dedupe_tags(const std::vector<std::string>& tags);

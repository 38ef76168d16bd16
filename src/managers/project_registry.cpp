#include "project_registry.hpp"
#include <core/constants.hpp>
#include <core/schema.hpp>
#include <core/utils.hpp>
#include <core/uuid.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <set>
#include <utility>

namespace fs = std::filesystem;

std::vector<std::string> dedupe_tags(const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& t : tags) {
        if (seen.insert(t).second) out.push_back(t);
    }
    return out;
}

static Result<ProjectEntry> not_found(const std::string& id) {
    return Result<ProjectEntry>::Err(ErrorKind::NotFound, "Project not found: " + id);
}

static void bump_updated(ProjectEntry& entry) {
    std::string now = now_iso();
    entry.updated_at = now < entry.created_at ? entry.created_at : now;
}

// True if `path` equals `dir` or lies below it, compared component-wise.
static bool is_within(const fs::path& path, const fs::path& dir) {
    auto p = path.begin();
    for (auto d = dir.begin(); d != dir.end(); ++d, ++p) {
        if (d->empty()) continue;   // trailing separator
        if (p == path.end() || *p != *d) return false;
    }
    return true;
}

static fs::path normalize(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) p = fs::path(path).lexically_normal();
    return p;
}

static const MachineStats* stats_for(const ConfigDocument& config, const std::string& machine) {
    auto it = config.machine_metadata.find(machine);
    return it == config.machine_metadata.end() ? nullptr : &it->second;
}

static int64_t count_of(const MachineStats* stats, const std::string& id) {
    if (!stats) return 0;
    auto it = stats->access_counts.find(id);
    return it == stats->access_counts.end() ? 0 : it->second;
}

static std::string last_of(const MachineStats* stats, const std::string& id) {
    if (!stats) return "";
    auto it = stats->last_accessed.find(id);
    return it == stats->last_accessed.end() ? "" : it->second;
}

// Never-accessed sorts after everything else
static int64_t last_millis(const MachineStats* stats, const std::string& id) {
    std::string last = last_of(stats, id);
    return last.empty() ? -1 : iso_millis(last);
}

ProjectRegistry::ProjectRegistry(ConfigStore store) : store_(std::move(store)) {}

template <typename T, typename Fn>
Result<T> ProjectRegistry::mutate(Fn&& apply) {
    auto guard = store_.lock();

    auto loaded = store_.load();
    if (loaded.is_err()) return Result<T>::Err(loaded);

    ConfigDocument config = std::move(loaded.value);
    Result<T> result = apply(config);
    if (result.is_err()) return result;

    auto saved = store_.save(config);
    if (saved.is_err()) return Result<T>::Err(saved);
    return result;
}

Result<ProjectEntry> ProjectRegistry::add(const std::string& path,
                                          const std::vector<std::string>& tags,
                                          const std::string& name) {
    if (path.empty()) {
        return Result<ProjectEntry>::Err(ErrorKind::InvalidPath, "Project path is empty");
    }

    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec || !fs::exists(abs, ec)) {
        return Result<ProjectEntry>::Err(ErrorKind::InvalidPath, "Path does not exist: " + path);
    }
    if (!fs::is_directory(abs, ec)) {
        return Result<ProjectEntry>::Err(ErrorKind::InvalidPath, "Not a directory: " + path);
    }
    fs::path canonical = fs::canonical(abs, ec);
    if (ec) {
        return Result<ProjectEntry>::Err(ErrorKind::InvalidPath,
            fmt::format("Cannot resolve {}: {}", path, ec.message()));
    }

    auto valid = validate_tags(tags);
    if (valid.is_err()) return Result<ProjectEntry>::Err(valid);

    std::string project_name = name.empty() ? canonical.filename().string() : name;
    if (project_name.empty()) project_name = canonical.string();

    return mutate<ProjectEntry>([&](ConfigDocument& config) {
        for (const auto& [id, p] : config.projects) {
            if (p.path == canonical.string()) {
                return Result<ProjectEntry>::Err(ErrorKind::AlreadyExists,
                    fmt::format("Project already registered at {} ({})", p.path, p.name));
            }
        }

        std::string id;
        for (int attempt = 0; attempt < UUID_MAX_ATTEMPTS; ++attempt) {
            std::string candidate = generate_uuid_v4();
            if (config.projects.count(candidate) == 0) {
                id = candidate;
                break;
            }
            pm_log("registry: uuid collision, regenerating");
        }
        if (id.empty()) {
            return Result<ProjectEntry>::Err(ErrorKind::IO, "Could not allocate a project id");
        }

        ProjectEntry entry;
        entry.id = id;
        entry.name = project_name;
        entry.path = canonical.string();
        entry.tags = dedupe_tags(tags);
        entry.created_at = now_iso();
        entry.updated_at = entry.created_at;
        config.projects[id] = entry;

        pm_log(fmt::format("registry: added {} ({}) at {}", entry.name, id, entry.path));
        return Result<ProjectEntry>::Ok(entry);
    });
}

Result<void> ProjectRegistry::remove(const std::string& id) {
    return mutate<void>([&](ConfigDocument& config) {
        if (config.projects.erase(id) == 0) {
            return Result<void>::Err(ErrorKind::NotFound, "Project not found: " + id);
        }
        pm_log("registry: removed " + id);
        return Result<void>::Ok();
    });
}

Result<ProjectEntry> ProjectRegistry::update_tags(const std::string& id,
                                                  const std::vector<std::string>& tags) {
    auto valid = validate_tags(tags);
    if (valid.is_err()) return Result<ProjectEntry>::Err(valid);

    return mutate<ProjectEntry>([&](ConfigDocument& config) {
        auto it = config.projects.find(id);
        if (it == config.projects.end()) return not_found(id);
        it->second.tags = dedupe_tags(tags);
        bump_updated(it->second);
        return Result<ProjectEntry>::Ok(it->second);
    });
}

Result<ProjectEntry> ProjectRegistry::add_tags(const std::string& id,
                                               const std::vector<std::string>& tags) {
    auto valid = validate_tags(tags);
    if (valid.is_err()) return Result<ProjectEntry>::Err(valid);

    return mutate<ProjectEntry>([&](ConfigDocument& config) {
        auto it = config.projects.find(id);
        if (it == config.projects.end()) return not_found(id);
        std::vector<std::string> merged = it->second.tags;
        merged.insert(merged.end(), tags.begin(), tags.end());
        it->second.tags = dedupe_tags(merged);
        bump_updated(it->second);
        return Result<ProjectEntry>::Ok(it->second);
    });
}

Result<ProjectEntry> ProjectRegistry::remove_tags(const std::string& id,
                                                  const std::vector<std::string>& tags) {
    return mutate<ProjectEntry>([&](ConfigDocument& config) {
        auto it = config.projects.find(id);
        if (it == config.projects.end()) return not_found(id);
        auto& current = it->second.tags;
        current.erase(std::remove_if(current.begin(), current.end(), [&](const std::string& t) {
            return std::find(tags.begin(), tags.end(), t) != tags.end();
        }), current.end());
        bump_updated(it->second);
        return Result<ProjectEntry>::Ok(it->second);
    });
}

Result<void> ProjectRegistry::touch(const std::string& id, const std::string& machine_id) {
    return mutate<void>([&](ConfigDocument& config) {
        if (config.projects.count(id) == 0) {
            return Result<void>::Err(ErrorKind::NotFound, "Project not found: " + id);
        }
        auto& stats = config.machine_metadata[machine_id];
        stats.last_accessed[id] = now_iso();
        stats.access_counts[id] += 1;
        return Result<void>::Ok();
    });
}

Result<ProjectEntry> ProjectRegistry::get(const std::string& id) const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<ProjectEntry>::Err(loaded);

    auto it = loaded.value.projects.find(id);
    if (it == loaded.value.projects.end()) return not_found(id);
    return Result<ProjectEntry>::Ok(it->second);
}

Result<ProjectEntry> ProjectRegistry::find_by_name(const std::string& name) const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<ProjectEntry>::Err(loaded);

    for (const auto& [id, p] : loaded.value.projects) {
        if (p.name == name) return Result<ProjectEntry>::Ok(p);
    }
    return Result<ProjectEntry>::Err(ErrorKind::NotFound, "No project named " + name);
}

Result<ProjectEntry> ProjectRegistry::resolve(const std::string& id_or_name) const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<ProjectEntry>::Err(loaded);
    const auto& projects = loaded.value.projects;

    auto exact = projects.find(id_or_name);
    if (exact != projects.end()) return Result<ProjectEntry>::Ok(exact->second);

    std::vector<const ProjectEntry*> by_name;
    std::vector<const ProjectEntry*> by_prefix;
    for (const auto& [id, p] : projects) {
        if (p.name == id_or_name) by_name.push_back(&p);
        if (!id_or_name.empty() && id.compare(0, id_or_name.size(), id_or_name) == 0) {
            by_prefix.push_back(&p);
        }
    }

    const auto& matches = by_name.empty() ? by_prefix : by_name;
    if (matches.size() == 1) return Result<ProjectEntry>::Ok(*matches[0]);
    if (matches.empty()) return not_found(id_or_name);

    std::string ids;
    for (const auto* p : matches) {
        ids += fmt::format("\n  {} {} ({})", p->id, p->name, p->path);
    }
    return Result<ProjectEntry>::Err(ErrorKind::Validation,
        fmt::format("'{}' matches {} projects:{}", id_or_name, matches.size(), ids));
}

Result<std::optional<ProjectEntry>> ProjectRegistry::find_containing(const std::string& path) const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<std::optional<ProjectEntry>>::Err(loaded);

    fs::path target = normalize(path);
    const ProjectEntry* best = nullptr;
    size_t best_depth = 0;
    for (const auto& [id, p] : loaded.value.projects) {
        fs::path dir(p.path);
        if (!is_within(target, dir)) continue;
        size_t depth = static_cast<size_t>(std::distance(dir.begin(), dir.end()));
        if (!best || depth > best_depth) {
            best = &p;
            best_depth = depth;
        }
    }
    if (!best) return Result<std::optional<ProjectEntry>>::Ok(std::nullopt);
    return Result<std::optional<ProjectEntry>>::Ok(*best);
}

Result<std::vector<ProjectEntry>> ProjectRegistry::list(const ProjectFilter& filter) const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<std::vector<ProjectEntry>>::Err(loaded);
    const ConfigDocument& config = loaded.value;

    std::vector<ProjectEntry> out;
    for (const auto& [id, p] : config.projects) {
        if (filter.tag && std::find(p.tags.begin(), p.tags.end(), *filter.tag) == p.tags.end()) {
            continue;
        }
        if (filter.language && p.language != filter.language) continue;
        out.push_back(p);
    }

    const MachineStats* stats = stats_for(config, filter.machine_id);
    auto by_name = [](const ProjectEntry& a, const ProjectEntry& b) { return a.name < b.name; };

    switch (filter.order) {
        case ProjectOrder::UpdatedAt:
            std::sort(out.begin(), out.end(), [&](const ProjectEntry& a, const ProjectEntry& b) {
                int64_t ua = iso_millis(a.updated_at), ub = iso_millis(b.updated_at);
                if (ua != ub) return ua > ub;
                return by_name(a, b);
            });
            break;
        case ProjectOrder::Name:
            std::sort(out.begin(), out.end(), [&](const ProjectEntry& a, const ProjectEntry& b) {
                if (a.name != b.name) return a.name < b.name;
                return a.id < b.id;
            });
            break;
        case ProjectOrder::LastAccessed:
            std::sort(out.begin(), out.end(), [&](const ProjectEntry& a, const ProjectEntry& b) {
                int64_t la = last_millis(stats, a.id), lb = last_millis(stats, b.id);
                if (la != lb) return la > lb;
                return by_name(a, b);
            });
            break;
        case ProjectOrder::AccessCount:
            std::sort(out.begin(), out.end(), [&](const ProjectEntry& a, const ProjectEntry& b) {
                int64_t ca = count_of(stats, a.id), cb = count_of(stats, b.id);
                if (ca != cb) return ca > cb;
                return by_name(a, b);
            });
            break;
    }

    if (filter.limit && out.size() > *filter.limit) out.resize(*filter.limit);
    return Result<std::vector<ProjectEntry>>::Ok(out);
}

Result<std::vector<ProjectEntry>> ProjectRegistry::find_by_path_prefix(const std::string& query,
                                                                       const std::string& machine_id) const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<std::vector<ProjectEntry>>::Err(loaded);
    const ConfigDocument& config = loaded.value;

    bool absolute = fs::path(query).is_absolute();
    std::vector<ProjectEntry> out;
    for (const auto& [id, p] : config.projects) {
        const std::string& field = absolute ? p.path : p.name;
        if (field.compare(0, query.size(), query) == 0) out.push_back(p);
    }

    const MachineStats* stats = stats_for(config, machine_id);
    std::sort(out.begin(), out.end(), [&](const ProjectEntry& a, const ProjectEntry& b) {
        int64_t ca = count_of(stats, a.id), cb = count_of(stats, b.id);
        if (ca != cb) return ca > cb;
        int64_t la = last_millis(stats, a.id), lb = last_millis(stats, b.id);
        if (la != lb) return la > lb;
        return a.name < b.name;
    });
    return Result<std::vector<ProjectEntry>>::Ok(out);
}

Result<AccessInfo> ProjectRegistry::access_info(const std::string& id,
                                                const std::string& machine_id) const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<AccessInfo>::Err(loaded);
    if (loaded.value.projects.count(id) == 0) {
        return Result<AccessInfo>::Err(ErrorKind::NotFound, "Project not found: " + id);
    }

    return Result<AccessInfo>::Ok(access_info_in(loaded.value, id, machine_id));
}

AccessInfo access_info_in(const ConfigDocument& config, const std::string& id,
                          const std::string& machine_id) {
    const MachineStats* stats = stats_for(config, machine_id);
    AccessInfo info;
    info.count = count_of(stats, id);
    std::string last = last_of(stats, id);
    if (!last.empty()) info.last_accessed = last;
    return info;
}

static std::vector<OrphanedStat> collect_orphans(const ConfigDocument& config) {
    std::vector<OrphanedStat> out;
    for (const auto& [machine, stats] : config.machine_metadata) {
        std::set<std::string> ids;
        for (const auto& kv : stats.last_accessed) ids.insert(kv.first);
        for (const auto& kv : stats.access_counts) ids.insert(kv.first);
        for (const auto& id : ids) {
            if (config.projects.count(id) == 0) out.push_back({machine, id});
        }
    }
    return out;
}

Result<std::vector<OrphanedStat>> ProjectRegistry::orphaned_stats() const {
    auto loaded = store_.load();
    if (loaded.is_err()) return Result<std::vector<OrphanedStat>>::Err(loaded);
    return Result<std::vector<OrphanedStat>>::Ok(collect_orphans(loaded.value));
}

Result<size_t> ProjectRegistry::prune_orphaned_stats() {
    return mutate<size_t>([&](ConfigDocument& config) {
        auto orphans = collect_orphans(config);
        for (const auto& o : orphans) {
            auto& stats = config.machine_metadata[o.machine_id];
            stats.last_accessed.erase(o.project_id);
            stats.access_counts.erase(o.project_id);
        }
        for (auto it = config.machine_metadata.begin(); it != config.machine_metadata.end();) {
            if (it->second.last_accessed.empty() && it->second.access_counts.empty()) {
                it = config.machine_metadata.erase(it);
            } else {
                ++it;
            }
        }
        if (!orphans.empty()) {
            pm_log(fmt::format("registry: pruned {} orphaned stat(s)", orphans.size()));
        }
        return Result<size_t>::Ok(orphans.size());
    });
}

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>

// Thin command-line front end over the registry and extension managers.
// Every run_* returns the process exit code.
class PmCLI {
public:
    PmCLI();
    PmCLI(fs::path config_path, fs::path extensions_dir);

    // args excludes argv[0]
    int run(const std::vector<std::string>& args);

    int run_init(const std::vector<std::string>& args);
    int run_add(const std::vector<std::string>& args);
    int run_remove(const std::vector<std::string>& args);
    int run_list(const std::vector<std::string>& args);
    int run_tag(const std::vector<std::string>& args);
    int run_switch(const std::vector<std::string>& args);
    int run_prune(const std::vector<std::string>& args);
    int run_config(const std::vector<std::string>& args);
    int run_ext(const std::vector<std::string>& args);
    int run_dispatch(const std::string& extension, const std::vector<std::string>& args);

    void print_usage() const;

private:
    int config_show();
    int config_list();
    int config_get(const std::vector<std::string>& args);
    int config_set(const std::vector<std::string>& args);
    int config_validate();
    int config_reset(const std::vector<std::string>& args);

    int ext_install(const std::vector<std::string>& args);
    int ext_uninstall(const std::vector<std::string>& args);
    int ext_list();
    int ext_pack(const std::vector<std::string>& args);

    // github_username from the config, or "" when there is none yet
    std::string github_username() const;

    ConfigStore store_;
    fs::path extensions_dir_;
};

#pragma once

#include <cstdint>

// ── Identity ────────────────────────────────────────────────
constexpr const char* PM_TOOL_NAME    = "pm";
constexpr const char* PM_VERSION      = "0.2.0";

// ── Configuration ───────────────────────────────────────────
constexpr const char* CONFIG_VERSION       = "1.2";   // current document schema
constexpr const char* CONFIG_FILENAME      = "config.yml";
constexpr const char* CONFIG_DIR_NAME      = ".config";
constexpr const char* CONFIG_SUBDIR_NAME   = "pm";
constexpr int DEFAULT_RECENT_PROJECTS      = 10;
constexpr int MAX_RECENT_PROJECTS          = 100;
constexpr int MAX_TAG_LENGTH               = 50;
constexpr int MAX_GITHUB_USERNAME_LENGTH   = 39;
constexpr int UUID_MAX_ATTEMPTS            = 16;      // regenerate on id collision
constexpr const char* DEFAULT_WORKSPACE_DIR = "workspace";   // under $HOME

// ── Extensions ──────────────────────────────────────────────
constexpr const char* EXTENSIONS_DIR_NAME    = "extensions";
constexpr const char* EXTENSION_MANIFEST     = "extension.yml";
constexpr const char* EXTENSION_ENTRY_POINT  = "binary";
constexpr const char* EXTENSION_ASSET_PREFIX = "pm-ext-";
constexpr const char* DEFAULT_RELEASE_HOST   = "https://github.com";
constexpr const char* DEFAULT_RELEASE_OWNER  = "pm-extensions";
constexpr const char* STORE_DIR_NAME         = ".store";
constexpr const char* STAGING_DIR_NAME       = ".staging";
constexpr const char* LOCKS_DIR_NAME         = ".locks";

// ── Network ─────────────────────────────────────────────────
constexpr long HTTP_CONNECT_TIMEOUT_SECS   = 10;
constexpr long HTTP_TOTAL_TIMEOUT_SECS     = 120;
constexpr int HTTP_MAX_ATTEMPTS            = 3;
constexpr int HTTP_RETRY_DELAY_MS          = 1000;

// ── Environment contract passed to extensions ───────────────
constexpr const char* ENV_CURRENT_PROJECT      = "PM_CURRENT_PROJECT";
constexpr const char* ENV_CURRENT_PROJECT_PATH = "PM_CURRENT_PROJECT_PATH";
constexpr const char* ENV_CONFIG_PATH          = "PM_CONFIG_PATH";
constexpr const char* ENV_VERSION              = "PM_VERSION";
constexpr const char* ENV_EXTENSION_DIR        = "PM_EXTENSION_DIR";
constexpr const char* ENV_EXTENSION_NAME       = "PM_EXTENSION_NAME";
constexpr const char* ENV_COMMAND_NAME         = "PM_COMMAND_NAME";

// ── Tool configuration overrides ────────────────────────────
constexpr const char* ENV_CONFIG_DIR       = "PM_CONFIG_DIR";
constexpr const char* ENV_EXTENSIONS_DIR   = "PM_EXTENSIONS_DIR";
constexpr const char* ENV_MACHINE_ID       = "PM_MACHINE_ID";
constexpr const char* ENV_RELEASE_HOST     = "PM_RELEASE_HOST";
constexpr const char* ENV_LOG_FILE         = "PM_LOG_FILE";

// ── Exit codes ──────────────────────────────────────────────
// 125 and 126 are reserved: extensions must not return them.
constexpr int EXIT_OK                  = 0;
constexpr int EXIT_FAILURE_CODE        = 1;
constexpr int EXIT_CHILD_SIGNALED      = 125;
constexpr int EXIT_SPAWN_FAILED        = 126;

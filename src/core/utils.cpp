#include "utils.hpp"
#include "constants.hpp"
#include "types.hpp"
#include <openssl/evp.h>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <fstream>
#include <memory>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "ok";
        case ErrorKind::NotFound:            return "not found";
        case ErrorKind::AlreadyExists:       return "already exists";
        case ErrorKind::InvalidPath:         return "invalid path";
        case ErrorKind::Validation:          return "validation error";
        case ErrorKind::Schema:              return "schema error";
        case ErrorKind::Parse:               return "parse error";
        case ErrorKind::UnsupportedVersion:  return "unsupported version";
        case ErrorKind::IO:                  return "I/O error";
        case ErrorKind::Download:            return "download error";
        case ErrorKind::Extract:             return "extract error";
        case ErrorKind::ChecksumMismatch:    return "checksum mismatch";
        case ErrorKind::Permission:          return "permission error";
        case ErrorKind::UnsupportedPlatform: return "unsupported platform";
        case ErrorKind::ExtensionNotFound:   return "extension not found";
        case ErrorKind::CommandNotFound:     return "command not found";
        case ErrorKind::Spawn:               return "spawn error";
    }
    return "unknown error";
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (v && *v) return std::string(v);
    return fallback;
}

std::string get_machine_id() {
    std::string id = env_or(ENV_MACHINE_ID);
    if (!id.empty()) return id;

    id = env_or("HOSTNAME");
    if (!id.empty()) return id;

    id = env_or("COMPUTERNAME");
    if (!id.empty()) return id;

#ifndef _WIN32
    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        return std::string(host);
    }
#endif

    std::string user = env_or("USER", env_or("USERNAME", "unknown"));
    return user + "@unknown";
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}Z", buf, static_cast<int>(ms.count()));
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
#ifdef _WIN32
        return _mkgmtime(&tm_buf);
#else
        return timegm(&tm_buf);
#endif
    }
    return 0;
}

int64_t iso_millis(const std::string& iso) {
    int64_t ms = static_cast<int64_t>(parse_iso_time(iso)) * 1000;
    auto dot = iso.find('.');
    if (dot != std::string::npos) {
        std::string frac;
        for (size_t i = dot + 1; i < iso.size() && std::isdigit(static_cast<unsigned char>(iso[i])); ++i) {
            frac += iso[i];
        }
        frac = frac.substr(0, 3);
        while (frac.size() < 3) frac += '0';
        ms += safe_stoi(frac, 0);
    }
    return ms;
}

bool is_iso_timestamp(const std::string& s) {
    // YYYY-MM-DDTHH:MM:SS
    static const char shape[] = "dddd-dd-ddTdd:dd:dd";
    const size_t base = sizeof(shape) - 1;
    if (s.size() < base) return false;
    for (size_t i = 0; i < base; ++i) {
        if (shape[i] == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        } else if (s[i] != shape[i]) {
            return false;
        }
    }
    size_t i = base;
    if (i < s.size() && s[i] == '.') {
        ++i;
        size_t digits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++digits; }
        if (digits == 0) return false;
    }
    if (i < s.size() && s[i] == 'Z') ++i;
    return i == s.size();
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : str) {
        if (c == delimiter) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string compute_file_sha256(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "";

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return "";

    char buf[65536];
    while (in) {
        in.read(buf, sizeof(buf));
        auto n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf, static_cast<size_t>(n)) != 1) return "";
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) return "";

    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += fmt::format("{:02x}", hash[i]);
    }
    return hex;
}

#include "platform.hpp"
#include <cstdlib>
#include <system_error>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <pwd.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

static bool is_dir(const fs::path& p) {
    std::error_code ec;
    return !p.empty() && fs::is_directory(p, ec);
}

std::optional<fs::path> home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (home && is_dir(home)) return fs::path(home);
    return std::nullopt;
#else
    const char* home = std::getenv("HOME");
    if (home && is_dir(home)) return fs::path(home);

    // HOME unset (cron, some service managers): ask the passwd database.
    long bufsize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufsize <= 0) bufsize = 16384;
    std::vector<char> buf(static_cast<size_t>(bufsize));
    struct passwd pw;
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pw, buf.data(), buf.size(), &result) == 0 && result &&
        result->pw_dir && is_dir(result->pw_dir)) {
        return fs::path(result->pw_dir);
    }
    return std::nullopt;
#endif
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

std::optional<fs::path> expand_user(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        auto home = home_dir();
        if (!home) return std::nullopt;
        return path.size() <= 2 ? *home : *home / path.substr(2);
    }
    return fs::path(path);
}

bool restrict_to_owner(const fs::path& path) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    return !ec;
}

} // namespace platform

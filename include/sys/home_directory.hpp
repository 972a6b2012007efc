#ifndef HOME_DIRECTORY_HPP
#define HOME_DIRECTORY_HPP

#include <pwd.h>
#include <unistd.h>
#include <cstdlib>
#include <string>

namespace sys {

/// Home directory of the current user, $HOME first, then the passwd entry.
inline std::string homeDirectory() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return home;
    }
    if (const passwd* pw = ::getpwuid(::getuid()); pw != nullptr && pw->pw_dir != nullptr) {
        return pw->pw_dir;
    }
    return {};
}

/// Expand a leading "~" or "~/" to the home directory. Other forms,
/// including "~user", are returned unchanged.
inline std::string expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    const auto home = homeDirectory();
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

}

#endif // HOME_DIRECTORY_HPP

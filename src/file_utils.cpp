#include "file_utils.h"
#include <sys/stat.h>
#include <unistd.h>
#include <pwd.h>
#include <limits.h>
#include <cstdlib>
#include <vector>

bool file_exists(const std::string& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0)
        return false;
    return S_ISREG(st.st_mode);
}

std::string read_symlink(const std::string& link)
{
    std::vector<char> buf(PATH_MAX);
    ssize_t len = readlink(link.c_str(), buf.data(), buf.size());
    if (len <= 0)
        return std::string();
    return std::string(buf.data(), len);
}

std::string get_exe_path()
{
    return read_symlink(PROCDIR "/self/exe");
}

std::string get_exe_name()
{
    std::string path = get_exe_path();
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash + 1 >= path.size())
        return "unknown";
    return path.substr(slash + 1);
}

std::string get_home_dir()
{
    const char* home = getenv("HOME");
    if (home && *home)
        return home;

    // sandboxed games sometimes run without HOME
    struct passwd pw, *result = nullptr;
    std::vector<char> buf(4096);
    if (getpwuid_r(getuid(), &pw, buf.data(), buf.size(), &result) == 0 && result)
        return result->pw_dir;
    return std::string();
}

std::string get_config_dir()
{
    const char* xdg = getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return xdg;

    std::string home = get_home_dir();
    if (home.empty())
        return home;
    return home + "/.config";
}

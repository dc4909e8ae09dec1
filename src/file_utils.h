#pragma once
#ifndef IMOVERLAY_FILE_UTILS_H
#define IMOVERLAY_FILE_UTILS_H

#include <string>

#ifndef PROCDIR
#define PROCDIR "/proc"
#endif

// Regular files only, directories don't count.
bool file_exists(const std::string& path);
std::string read_symlink(const std::string& link);
std::string get_exe_path();
// Basename of the running executable, "unknown" if /proc can't tell.
std::string get_exe_name();
std::string get_home_dir();
// $XDG_CONFIG_HOME or ~/.config, empty without either.
std::string get_config_dir();

#endif //IMOVERLAY_FILE_UTILS_H

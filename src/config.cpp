#include <fstream>
#include <cctype>
#include <locale>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include "config.h"
#include "file_utils.h"
#include "string_utils.h"

namespace ImOverlay {

// '#' starts a comment at the beginning of a line or after whitespace, so
// values like font paths may still contain one.
static size_t find_comment(const std::string& line)
{
    for (size_t i = 0; i < line.size(); i++) {
        if (line[i] == '#' && (i == 0 || isspace((unsigned char)line[i - 1])))
            return i;
    }
    return std::string::npos;
}

void parseConfigLine(std::string line, std::unordered_map<std::string, std::string>& options)
{
    size_t comment = find_comment(line);
    if (comment != std::string::npos)
        line.erase(comment);

    std::string key, value = "1";
    size_t eq = line.find('=');
    if (eq != std::string::npos) {
        key = line.substr(0, eq);
        value = trim_copy(line.substr(eq + 1));
    } else {
        key = line;
    }

    trim(key);
    if (key.empty())
        return;
    options[key] = value;
}

std::vector<std::string> config_file_paths()
{
    if (const char *cfg = getenv("IMOVERLAY_CONFIGFILE"))
        return { cfg };

    const std::string config_dir = get_config_dir();
    if (config_dir.empty())
        return {};

    const std::string dir = config_dir + "/imoverlay/";
    return { dir + get_exe_name() + ".conf", dir + "imoverlay.conf" };
}

bool parseConfigFile(overlay_params& params)
{
    params.options.clear();

    for (const auto& path : config_file_paths()) {
        std::ifstream stream(path);
        if (!stream.is_open()) {
            SPDLOG_DEBUG("no config at '{}'", path);
            continue;
        }

        stream.imbue(std::locale::classic());
        SPDLOG_INFO("parsing config: '{}'", path);
        std::string line;
        while (std::getline(stream, line))
            parseConfigLine(line, params.options);
        params.config_file_path = path;
        return true;
    }

    return false;
}

}

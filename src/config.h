#pragma once
#ifndef IMOVERLAY_CONFIG_H
#define IMOVERLAY_CONFIG_H

#include <string>
#include <vector>
#include <unordered_map>
#include "overlay_params.h"

namespace ImOverlay {

// Candidate config files, most specific first.
std::vector<std::string> config_file_paths();
// Reads the first existing config file into params.options. Returns false
// if there was none.
bool parseConfigFile(overlay_params& params);
// "key = value  # comment", a bare key means "1".
void parseConfigLine(std::string line, std::unordered_map<std::string, std::string>& options);

}

#endif //IMOVERLAY_CONFIG_H

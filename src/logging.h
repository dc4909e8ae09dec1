#pragma once
#ifndef IMOVERLAY_LOGGING_H
#define IMOVERLAY_LOGGING_H

#include <spdlog/spdlog.h>

namespace ImOverlay {

// Installs the "IMOVERLAY" default logger. Safe to call more than once.
void init_spdlog();

}

#endif //IMOVERLAY_LOGGING_H

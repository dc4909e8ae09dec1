#include <cstdlib>
#include <string>
#include <vector>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include "logging.h"
#include "file_utils.h"

namespace ImOverlay {

void init_spdlog()
{
   if (spdlog::get("IMOVERLAY"))
      return;

   spdlog::set_default_logger(spdlog::stderr_color_mt("IMOVERLAY"));
   if (getenv("IMOVERLAY_USE_LOGFILE"))
   {
      try
      {
         // no rotation on open, several processes of one game may share the file
         auto log = std::make_shared<spdlog::sinks::rotating_file_sink_mt> (get_config_dir() + "/imoverlay/imoverlay.log", 10*1024*1024, 5, false);
         spdlog::get("IMOVERLAY")->sinks().push_back(log);
      }
      catch (const spdlog::spdlog_ex &ex)
      {
         SPDLOG_ERROR("{}", ex.what());
      }
   }
   spdlog::cfg::load_env_levels();

   std::string log_level = "info";
   if (getenv("IMOVERLAY_LOG_LEVEL")) {
      std::string env_level = getenv("IMOVERLAY_LOG_LEVEL");
      std::transform(env_level.begin(), env_level.end(), env_level.begin(), ::tolower);
      const std::vector<std::string> levels = {"trace","debug","info","warning","error","critical","off"};
      if (std::find(levels.begin(), levels.end(), env_level) != levels.end())
         log_level = env_level;
      else
         SPDLOG_WARN("Unknown IMOVERLAY_LOG_LEVEL '{}', using info", env_level);
   }
#ifdef DEBUG
   else
      log_level = "debug";
#endif
   spdlog::set_level(spdlog::level::from_str(log_level));
}

}

#pragma once
#include <string>

namespace pm2d::paths {
// Location of config.json: $PM2D_CONFIG_DIR/config.json when set, else the
// first config.json found walking up from the working directory, else ./config.json.
std::string configFilePath();
}

#pragma once

#include "panel_link.h"
#include "plugin_config.h"
#include "sim_link.h"

#include <istream>
#include <string>
#include <vector>

namespace panelbridge {

struct PanelPrefs {
    std::string name;
    bool enabled = false;
    PanelType type = PanelType::EventSim;
    std::string port;
    int baud = 0;  // 0 = default of the panel type
    int resetDelayMs = 2000;
    bool restart = true;
    int restartSec = 5;
};

struct Prefs {
    bool logfileEnabled = true;
    std::string logfileName = PLUGIN_LOG_NAME;
    bool debug = false;
    struct SimPrefs {
        std::string clientName = PLUGIN_SIM_CLIENT_NAME;
        int reconnectSec = 5;
        int pollMs = 10;
    } sim;
    std::vector<PanelPrefs> panels;
};

// Defaults written on first run: two example panels, both disabled.
Prefs defaultPrefs();

// Reads key=value lines. Unknown keys are ignored, malformed numbers keep
// their default.
Prefs parsePrefs(std::istream& in);

// Loads `path`, creating it with defaultPrefs() when it does not exist.
Prefs loadPrefs(const std::string& path);

std::vector<std::string> buildDefaultPrefsLines(const Prefs& prefs);
bool writeDefaultPrefsFile(const std::string& path, const Prefs& prefs);

void logPrefs(const Prefs& prefs);

PanelLinkConfig panelLinkConfigFromPrefs(const PanelPrefs& panel);
SimLinkConfig simLinkConfigFromPrefs(const Prefs& prefs);

}  // namespace panelbridge

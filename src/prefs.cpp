#include "prefs.h"

#include "log.h"
#include "plugin_utils.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace panelbridge {

namespace {

void parseInt(const std::string& key, const std::string& val, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (trimString(val.substr(used)).empty()) {
            out = parsed;
            return;
        }
    } catch (const std::exception&) {
    }
    logLine("Prefs: invalid number for " + key + ": '" + val + "', keeping " + std::to_string(out));
}

PanelPrefs& panelByName(Prefs& prefs, const std::string& name) {
    for (auto& panel : prefs.panels) {
        if (panel.name == name) {
            return panel;
        }
    }
    PanelPrefs panel;
    panel.name = name;
    prefs.panels.push_back(panel);
    return prefs.panels.back();
}

void applyPanelKey(PanelPrefs& panel, const std::string& field, const std::string& key, const std::string& val) {
    if (field == "enabled") parseBool(val, panel.enabled);
    else if (field == "port") panel.port = val;
    else if (field == "type") {
        if (!parsePanelType(val, panel.type)) {
            logLine("Prefs: unknown panel type for " + key + ": '" + val + "'");
        }
    }
    else if (field == "baud") parseInt(key, val, panel.baud);
    else if (field == "reset_delay_ms") parseInt(key, val, panel.resetDelayMs);
    else if (field == "restart") parseBool(val, panel.restart);
    else if (field == "restart_sec") parseInt(key, val, panel.restartSec);
}

void normalizePrefs(Prefs& prefs) {
    if (prefs.sim.reconnectSec < 1) prefs.sim.reconnectSec = 1;
    if (prefs.sim.pollMs < 1) prefs.sim.pollMs = 1;
    if (prefs.sim.pollMs > 100) prefs.sim.pollMs = 100;
    if (prefs.sim.clientName.empty()) prefs.sim.clientName = PLUGIN_SIM_CLIENT_NAME;
    for (auto& panel : prefs.panels) {
        if (panel.baud < 0) panel.baud = 0;
        if (panel.resetDelayMs < 0) panel.resetDelayMs = 0;
        if (panel.restartSec < 0) panel.restartSec = 0;
    }
}

}  // namespace

Prefs defaultPrefs() {
    Prefs prefs;
    PanelPrefs eventsim;
    eventsim.name = "eventsim";
    eventsim.type = PanelType::EventSim;
    eventsim.port = "/dev/ttyACM0";
    PanelPrefs airspeed;
    airspeed.name = "airspeed";
    airspeed.type = PanelType::Airspeed;
    airspeed.port = "/dev/ttyUSB0";
    prefs.panels.push_back(eventsim);
    prefs.panels.push_back(airspeed);
    return prefs;
}

Prefs parsePrefs(std::istream& in) {
    Prefs prefs;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = trimString(line.substr(0, eq));
        const std::string val = trimString(line.substr(eq + 1));

        if (key == "log.enabled") parseBool(val, prefs.logfileEnabled);
        else if (key == "log.file") prefs.logfileName = val;
        else if (key == "debug") parseBool(val, prefs.debug);
        else if (key == "sim.client_name") prefs.sim.clientName = val;
        else if (key == "sim.reconnect_sec") parseInt(key, val, prefs.sim.reconnectSec);
        else if (key == "sim.poll_ms") parseInt(key, val, prefs.sim.pollMs);
        else if (startsWith(key, "panel.")) {
            // panel.<name>.<field>
            auto dot = key.rfind('.');
            if (dot <= 6) {
                continue;
            }
            const std::string name = key.substr(6, dot - 6);
            const std::string field = key.substr(dot + 1);
            applyPanelKey(panelByName(prefs, name), field, key, val);
        }
    }
    normalizePrefs(prefs);
    return prefs;
}

Prefs loadPrefs(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Prefs prefs = defaultPrefs();
        writeDefaultPrefsFile(path, prefs);
        return prefs;
    }
    return parsePrefs(in);
}

std::vector<std::string> buildDefaultPrefsLines(const Prefs& prefs) {
    std::vector<std::string> lines;
    lines.push_back("# " + std::string(PLUGIN_PREFS_FILE));
    lines.push_back("# Auto-generated by " + std::string(PLUGIN_NAME) + " on first run.");
    lines.push_back("# Edit this file and run " + std::string(PLUGIN_COMMAND_PREFIX) + "/reload_prefs.");
    lines.push_back("");
    lines.push_back("# Logging");
    lines.push_back("log.enabled=" + bool01(prefs.logfileEnabled));
    lines.push_back("log.file=" + prefs.logfileName);
    lines.push_back("debug=" + bool01(prefs.debug));
    lines.push_back("");
    lines.push_back("# Simulator connection");
    lines.push_back("sim.client_name=" + prefs.sim.clientName);
    lines.push_back("sim.reconnect_sec=" + std::to_string(prefs.sim.reconnectSec));
    lines.push_back("sim.poll_ms=" + std::to_string(prefs.sim.pollMs));
    for (const auto& panel : prefs.panels) {
        lines.push_back("");
        lines.push_back("# Panel '" + panel.name + "' (type EVENTSIM or AIRSPEED, baud 0 = type default)");
        const std::string p = "panel." + panel.name + ".";
        lines.push_back(p + "enabled=" + bool01(panel.enabled));
        lines.push_back(p + "type=" + panelTypeToString(panel.type));
        lines.push_back(p + "port=" + panel.port);
        lines.push_back(p + "baud=" + std::to_string(panel.baud));
        lines.push_back(p + "reset_delay_ms=" + std::to_string(panel.resetDelayMs));
        lines.push_back(p + "restart=" + bool01(panel.restart));
        lines.push_back(p + "restart_sec=" + std::to_string(panel.restartSec));
    }
    return lines;
}

bool writeDefaultPrefsFile(const std::string& path, const Prefs& prefs) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        logLine("Prefs: failed to create directory for " + path + " (" + ec.message() + ")");
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        logLine("Prefs: failed to create default prefs at " + path);
        return false;
    }
    for (const auto& line : buildDefaultPrefsLines(prefs)) {
        out << line << "\n";
    }
    logLine("Prefs: created default prefs at " + path);
    return true;
}

void logPrefs(const Prefs& prefs) {
    logLine("Sim: client_name=" + prefs.sim.clientName +
            ", reconnect_sec=" + std::to_string(prefs.sim.reconnectSec) +
            ", poll_ms=" + std::to_string(prefs.sim.pollMs) +
            ", debug=" + bool01(prefs.debug));
    for (const auto& panel : prefs.panels) {
        if (!panel.enabled) {
            continue;
        }
        const PanelLinkConfig cfg = panelLinkConfigFromPrefs(panel);
        logLine("Panel '" + panel.name + "' enabled: type=" + panelTypeToString(panel.type) +
                ", port=" + panel.port + ", " + serialSettingsSummary(cfg.serial) +
                ", reset_delay_ms=" + std::to_string(panel.resetDelayMs) +
                ", restart=" + bool01(panel.restart) +
                ", restart_sec=" + std::to_string(panel.restartSec));
    }
}

PanelLinkConfig panelLinkConfigFromPrefs(const PanelPrefs& panel) {
    PanelLinkConfig cfg;
    cfg.name = panel.name;
    cfg.type = panel.type;
    cfg.port = panel.port;
    cfg.serial.baud = panel.baud > 0 ? panel.baud : panelTraits(panel.type).defaultBaud;
    cfg.resetDelayMs = panel.resetDelayMs;
    return cfg;
}

SimLinkConfig simLinkConfigFromPrefs(const Prefs& prefs) {
    SimLinkConfig cfg;
    cfg.clientName = prefs.sim.clientName;
    cfg.reconnectDelay = std::chrono::seconds(prefs.sim.reconnectSec);
    cfg.pollTimeout = std::chrono::milliseconds(prefs.sim.pollMs);
    return cfg;
}

}  // namespace panelbridge

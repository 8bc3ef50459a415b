#include "plugin_config.h"

#include "XPLMPlugin.h"
#include "XPLMProcessing.h"
#include "XPLMUtilities.h"

#include "bridge.h"
#include "log.h"
#include "prefs.h"
#include "serial_port.h"
#include "xplm_sim_host.h"

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

using namespace panelbridge;

namespace {

static const char* kPluginVersion = PLUGIN_VERSION;

static Prefs g_prefs;
static bool g_pluginEnabled = false;
static bool g_aircraftLoaded = true;
static std::unique_ptr<XplmSimHost> g_host;
static std::unique_ptr<Bridge> g_bridge;
static XPLMCommandRef g_cmdReloadPrefs = nullptr;
static XPLMCommandRef g_cmdListPorts = nullptr;

std::string getPrefsPath() {
    char sysPath[512]{};
    XPLMGetSystemPath(sysPath);
    std::string base(sysPath);
    if (!base.empty() && base.back() != '/' && base.back() != '\\') {
        base.push_back('/');
    }
    return base + "Output/preferences/" + std::string(PLUGIN_PREFS_FILE);
}

std::string makePluginPath(const std::string& relative) {
    char sysPath[512]{};
    XPLMGetSystemPath(sysPath);
    std::string base(sysPath);
    if (!base.empty() && base.back() != '/' && base.back() != '\\') {
        base.push_back('/');
    }
    return base + relative;
}

static void openLogFileFromPrefs() {
    closeLogFile();
    if (!g_prefs.logfileEnabled) {
        return;
    }
    openLogFile(makePluginPath("Resources/plugins/" + std::string(PLUGIN_DIR) + "/log/" + g_prefs.logfileName));
}

static std::unique_ptr<SerialTransport> makeSerialPort(const PanelLinkConfig& /*cfg*/) {
    return std::make_unique<SerialPort>();
}

static void startBridge() {
    if (g_bridge) {
        return;
    }
    g_bridge = std::make_unique<Bridge>(g_prefs, *g_host, makeSerialPort);
    g_bridge->start();
}

static void stopBridge() {
    if (!g_bridge) {
        return;
    }
    g_bridge->stop();
    g_bridge.reset();
}

static void updateHostOnline(const char* reason) {
    g_host->setOnline(g_pluginEnabled && g_aircraftLoaded, reason);
}

static void reloadPrefs() {
    // Offline first so the simulation link stops waiting on the flight loop.
    g_host->setOnline(false, "prefs reload");
    stopBridge();

    g_prefs = loadPrefs(getPrefsPath());
    setDebugLogging(g_prefs.debug);
    openLogFileFromPrefs();
    logLine("Prefs reloaded from " + getPrefsPath());
    logPrefs(g_prefs);

    if (g_pluginEnabled) {
        updateHostOnline("prefs reload");
        startBridge();
        logLine("Prefs reload complete.");
    } else {
        logLine("Prefs reload complete (plugin disabled).");
    }
}

static void listPorts() {
    std::vector<std::string> ports = listSerialPorts();
    if (ports.empty()) {
        logLine("No serial ports found");
        return;
    }
    logLine("Serial ports (" + std::to_string(ports.size()) + "):");
    for (const auto& port : ports) {
        logLine("  " + port);
    }
}

int commandHandler(XPLMCommandRef cmd, XPLMCommandPhase phase, void* /*refcon*/) {
    if (phase != xplm_CommandBegin) {
        return 1;
    }
    if (cmd == g_cmdReloadPrefs) {
        reloadPrefs();
    } else if (cmd == g_cmdListPorts) {
        listPorts();
    }
    return 1;
}

float flightLoopCallback(
    float /*inElapsedSinceLastCall*/,
    float /*inElapsedTimeSinceLastFlightLoop*/,
    int /*inCounter*/,
    void* /*inRefcon*/) {
    g_host->pump();
    if (g_bridge) {
        g_bridge->supervise();
    }
    return -1.0f;  // next frame
}

static void pluginStart() {
    setLogSink([](const std::string& line) { XPLMDebugString(line.c_str()); });
    g_prefs = loadPrefs(getPrefsPath());
    setDebugLogging(g_prefs.debug);
    logLine("Prefs loaded from " + getPrefsPath());
    openLogFileFromPrefs();
    logLine(std::string("Plugin version ") + kPluginVersion);
    logPrefs(g_prefs);

    g_host = std::make_unique<XplmSimHost>();

    auto cmdName = [](const char* suffix) {
        return std::string(PLUGIN_COMMAND_PREFIX) + "/" + suffix;
    };
    std::string cmdReload = cmdName("reload_prefs");
    std::string cmdReloadDesc = "Reload " + std::string(PLUGIN_PREFS_FILE) + " and reconnect panels";
    std::string cmdPorts = cmdName("list_ports");
    g_cmdReloadPrefs = XPLMCreateCommand(cmdReload.c_str(), cmdReloadDesc.c_str());
    g_cmdListPorts = XPLMCreateCommand(cmdPorts.c_str(), "Log the serial ports found on this machine");
    XPLMRegisterCommandHandler(g_cmdReloadPrefs, commandHandler, 1, nullptr);
    XPLMRegisterCommandHandler(g_cmdListPorts, commandHandler, 1, nullptr);

    XPLMRegisterFlightLoopCallback(flightLoopCallback, -1.0f, nullptr);
    logLine("Started");
}

static void pluginStop() {
    g_host->setOnline(false, "plugin stop");
    stopBridge();
    if (g_cmdReloadPrefs) {
        XPLMUnregisterCommandHandler(g_cmdReloadPrefs, commandHandler, 1, nullptr);
        g_cmdReloadPrefs = nullptr;
    }
    if (g_cmdListPorts) {
        XPLMUnregisterCommandHandler(g_cmdListPorts, commandHandler, 1, nullptr);
        g_cmdListPorts = nullptr;
    }
    XPLMUnregisterFlightLoopCallback(flightLoopCallback, nullptr);
    g_host.reset();
    closeLogFile();
    setLogSink(nullptr);
}

static void pluginDisable() {
    g_pluginEnabled = false;
    updateHostOnline("plugin disable");
    stopBridge();
    logLine("Disabled");
}

static int pluginEnable() {
    g_pluginEnabled = true;
    updateHostOnline("plugin enable");
    startBridge();
    logLine("Enabled");
    return 1;
}

static void pluginReceiveMessage(int inMessage, void* inParam) {
    // Only the user aircraft (index 0) matters.
    if (reinterpret_cast<intptr_t>(inParam) != 0) {
        return;
    }
    if (inMessage == XPLM_MSG_PLANE_UNLOADED) {
        g_aircraftLoaded = false;
        updateHostOnline("aircraft unloaded");
    } else if (inMessage == XPLM_MSG_PLANE_LOADED) {
        g_aircraftLoaded = true;
        updateHostOnline("aircraft loaded");
    }
}

}  // namespace

PLUGIN_API int XPluginStart(char* outName, char* outSig, char* outDesc) {
    std::strncpy(outName, PLUGIN_NAME, 255);
    outName[255] = '\0';
    std::strncpy(outSig, PLUGIN_SIGNATURE, 255);
    outSig[255] = '\0';
    std::string desc = std::string(PLUGIN_DESC) + " (v" + kPluginVersion + ")";
    std::strncpy(outDesc, desc.c_str(), 255);
    outDesc[255] = '\0';

    pluginStart();
    return 1;
}

PLUGIN_API void XPluginStop() {
    pluginStop();
}

PLUGIN_API void XPluginDisable() {
    pluginDisable();
}

PLUGIN_API int XPluginEnable() {
    return pluginEnable();
}

PLUGIN_API void XPluginReceiveMessage(XPLMPluginID /*inFromWho*/, int inMessage, void* inParam) {
    pluginReceiveMessage(inMessage, inParam);
}

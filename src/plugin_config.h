#pragma once

#ifndef PLUGIN_VERSION
#define PLUGIN_VERSION "0.3"
#endif

#ifndef PLUGIN_NAME
#define PLUGIN_NAME "PanelBridge"
#endif
#ifndef PLUGIN_SIGNATURE
#define PLUGIN_SIGNATURE "com.panelbridge.xp"
#endif
#ifndef PLUGIN_DESC
#define PLUGIN_DESC "Serial instrument panel bridge"
#endif
#ifndef PLUGIN_DIR
#define PLUGIN_DIR "PanelBridge"
#endif
#ifndef PLUGIN_COMMAND_PREFIX
#define PLUGIN_COMMAND_PREFIX "PanelBridge"
#endif
#ifndef PLUGIN_PREFS_FILE
#define PLUGIN_PREFS_FILE "PanelBridge.prf"
#endif
#ifndef PLUGIN_LOG_NAME
#define PLUGIN_LOG_NAME "panelbridge.log"
#endif
#ifndef PLUGIN_LOG_PREFIX
#define PLUGIN_LOG_PREFIX "PanelBridge"
#endif
#ifndef PLUGIN_SIM_CLIENT_NAME
#define PLUGIN_SIM_CLIENT_NAME "PanelBridge"
#endif

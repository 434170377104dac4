/**
 * InkDeck - NVS Storage Module
 * Implementation
 */

#include "storage.h"
#include "config.h"
#include <Preferences.h>
#include <string.h>

// Static variables
static Preferences g_preferences;
static bool g_initialized = false;

// NVS keys
static const char* KEY_WIFI_SSID = "wifi_ssid";
static const char* KEY_WIFI_PASS = "wifi_pass";

bool storageInit() {
    if (g_initialized) {
        return true; // Already initialized
    }

    // Open NVS namespace in read-write mode
    bool success = g_preferences.begin(NVS_NAMESPACE, false);
    if (success) {
        g_initialized = true;
        DEBUG_PRINTLN(g_debug_storage, "Storage: NVS initialized");
    } else {
        LOG_PRINTLN("Storage: Failed to initialize NVS");
    }

    return success;
}

bool storageSaveWifiCredentials(const WifiCredentials& creds) {
    if (!g_initialized) {
        LOG_PRINTLN("Storage: Not initialized");
        return false;
    }

    size_t ssid_written = g_preferences.putString(KEY_WIFI_SSID, creds.ssid);
    g_preferences.putString(KEY_WIFI_PASS, creds.password);

    // putString() returns 0 on failure; an empty password legitimately writes 0 bytes
    if (ssid_written == 0) {
        LOG_PRINTLN("Storage: Failed to save Wi-Fi SSID");
        return false;
    }

    DEBUG_PRINTF(g_debug_storage, "Storage: Saved Wi-Fi network \"%s\"\n", creds.ssid);
    return true;
}

bool storageLoadWifiCredentials(WifiCredentials& creds) {
    strncpy(creds.ssid, WIFI_DEFAULT_SSID, sizeof(creds.ssid) - 1);
    creds.ssid[sizeof(creds.ssid) - 1] = '\0';
    strncpy(creds.password, WIFI_DEFAULT_PASSWORD, sizeof(creds.password) - 1);
    creds.password[sizeof(creds.password) - 1] = '\0';

    if (!g_initialized) {
        LOG_PRINTLN("Storage: Not initialized, using default Wi-Fi credentials");
        return creds.ssid[0] != '\0';
    }

    if (g_preferences.isKey(KEY_WIFI_SSID)) {
        g_preferences.getString(KEY_WIFI_SSID, creds.ssid, sizeof(creds.ssid));
        g_preferences.getString(KEY_WIFI_PASS, creds.password, sizeof(creds.password));
        DEBUG_PRINTF(g_debug_storage, "Storage: Loaded Wi-Fi network \"%s\"\n", creds.ssid);
    }

    return creds.ssid[0] != '\0';
}

bool storageClearWifiCredentials() {
    if (!g_initialized) {
        LOG_PRINTLN("Storage: Not initialized");
        return false;
    }

    g_preferences.remove(KEY_WIFI_SSID);
    g_preferences.remove(KEY_WIFI_PASS);
    DEBUG_PRINTLN(g_debug_storage, "Storage: Wi-Fi credentials cleared");
    return true;
}

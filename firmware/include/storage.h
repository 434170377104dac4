/**
 * InkDeck - NVS Storage Module
 * Persistent storage for network credentials
 */

#ifndef STORAGE_H
#define STORAGE_H

#include <Arduino.h>

// Wi-Fi credentials (NUL-terminated, sized for 802.11 limits)
struct WifiCredentials {
    char ssid[33];
    char password[64];
};

// Initialize storage module (opens NVS namespace)
bool storageInit();

// Save Wi-Fi credentials to NVS
bool storageSaveWifiCredentials(const WifiCredentials& creds);

// Load Wi-Fi credentials from NVS (falls back to WIFI_DEFAULT_* from config.h)
// Returns true if a non-empty SSID is available
bool storageLoadWifiCredentials(WifiCredentials& creds);

// Remove stored credentials
bool storageClearWifiCredentials();

#endif // STORAGE_H

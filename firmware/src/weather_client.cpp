/**
 * InkDeck - Weather Client
 * Implementation
 *
 * Wi-Fi is only up for the duration of a fetch. The first successful
 * connection also syncs the wall clock over NTP.
 */

#include <HTTPClient.h>
#include <WiFi.h>
#include <string.h>
#include "weather_client.h"
#include "inkdeck.h"
#include "storage.h"

WeatherClient::WeatherClient(RtcClock& clock)
    : clock_(clock), time_synced_(false) {}

bool WeatherClient::hasNetworkConfig() {
    WifiCredentials creds;
    return storageLoadWifiCredentials(creds);
}

bool WeatherClient::configureNetwork(const std::string& ssid, const std::string& password) {
    WifiCredentials creds;
    memset(&creds, 0, sizeof(creds));
    strncpy(creds.ssid, ssid.c_str(), sizeof(creds.ssid) - 1);
    strncpy(creds.password, password.c_str(), sizeof(creds.password) - 1);
    return storageSaveWifiCredentials(creds);
}

bool WeatherClient::forgetNetwork() {
    return storageClearWifiCredentials();
}

bool WeatherClient::connectWifi() {
    if (WiFi.status() == WL_CONNECTED) {
        return true;
    }

    WifiCredentials creds;
    if (!storageLoadWifiCredentials(creds)) {
        last_error_ = "No Wi-Fi configured";
        return false;
    }

    DEBUG_PRINTF(g_debug_weather, "[WiFi] Connecting to %s\n", creds.ssid);
    WiFi.mode(WIFI_STA);
    WiFi.begin(creds.ssid, creds.password);

    const uint32_t start = millis();
    while (WiFi.status() != WL_CONNECTED) {
        if (millis() - start > WIFI_CONNECT_TIMEOUT_MS) {
            LOG_PRINTF("[WiFi] Connection to %s timed out\n", creds.ssid);
            last_error_ = "Wi-Fi connect timeout";
            disconnectWifi();
            return false;
        }
        delay(250);
    }

    DEBUG_PRINTF(g_debug_weather, "[WiFi] Connected, IP %s\n", WiFi.localIP().toString().c_str());
    return true;
}

void WeatherClient::disconnectWifi() {
    WiFi.disconnect(true);
    WiFi.mode(WIFI_OFF);
}

bool WeatherClient::httpGet(const std::string& url, std::string& body) {
    HTTPClient http;
    http.setTimeout(WEATHER_HTTP_TIMEOUT_MS);
    http.setConnectTimeout(WEATHER_HTTP_TIMEOUT_MS);

    if (!http.begin(url.c_str())) {
        last_error_ = "HTTP client init failed";
        LOG_PRINTLN("[Weather] HTTP client failed to initialise");
        return false;
    }

    const int code = http.GET();
    DEBUG_PRINTF(g_debug_weather, "[Weather] HTTP status code: %d\n", code);

    if (code != HTTP_CODE_OK) {
        char reason[48];
        if (code < 0) {
            snprintf(reason, sizeof(reason), "Network: %s", HTTPClient::errorToString(code).c_str());
        } else {
            snprintf(reason, sizeof(reason), "HTTP %d", code);
        }
        last_error_ = reason;
        http.end();
        return false;
    }

    String payload = http.getString();
    http.end();
    body.assign(payload.c_str(), payload.length());
    return true;
}

bool WeatherClient::fetch(const std::string& location, WeatherReport& out) {
    last_error_.clear();
    digitalWrite(PIN_LED, HIGH);

    bool ok = connectWifi();

#if ENABLE_NTP_SYNC
    if (ok && !time_synced_) {
        time_synced_ = clock_.syncFromNtp();
    }
#endif

    std::string body;
    if (ok) {
        std::string url = buildWeatherUrl(location);
        DEBUG_PRINTF(g_debug_weather, "[Weather] GET %s\n", url.c_str());
        ok = httpGet(url, body);
    }

    if (ok) {
        ok = parseWeatherReport(body, out, last_error_);
    }

    disconnectWifi();
    digitalWrite(PIN_LED, LOW);

    if (!ok) {
        LOG_PRINTF("[Weather] Unavailable: %s\n", last_error_.c_str());
    }
    return ok;
}

/**
 * InkDeck - Weather Client
 * WeatherProvider over Wi-Fi and HTTP, credentials kept in NVS
 */

#ifndef WEATHER_CLIENT_H
#define WEATHER_CLIENT_H

#include <Arduino.h>
#include "rtc_clock.h"
#include "weather.h"

class WeatherClient : public WeatherProvider {
public:
    explicit WeatherClient(RtcClock& clock);

    bool hasNetworkConfig();
    bool configureNetwork(const std::string& ssid, const std::string& password);
    bool forgetNetwork();
    bool fetch(const std::string& location, WeatherReport& out);
    const std::string& lastError() const { return last_error_; }

private:
    bool connectWifi();
    void disconnectWifi();
    bool httpGet(const std::string& url, std::string& body);

    RtcClock& clock_;
    std::string last_error_;
    bool time_synced_;
};

#endif // WEATHER_CLIENT_H

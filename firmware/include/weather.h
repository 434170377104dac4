/**
 * InkDeck - Weather
 * Forecast report, document parser and the provider interface
 *
 * The provider document is the wttr.in "j1" JSON format. Numeric fields
 * arrive as strings ("temp_F": "54") and are converted while parsing.
 */

#ifndef WEATHER_H
#define WEATHER_H

#include <string>

#define WEATHER_FORECAST_DAYS   2
#define WEATHER_MIDDAY_SLOT     4   // hourly[] entry used for a day's icon (12:00)

struct WeatherDay {
    std::string date;            // "YYYY-MM-DD"
    int max_f;
    int min_f;
    int code;                    // Midday weather code
    std::string description;
};

struct WeatherReport {
    std::string location;        // Resolved area name
    std::string region;
    int temp_f;
    int feels_like_f;
    int humidity;
    int wind_mph;
    int code;                    // Current weather code
    std::string description;
    WeatherDay days[WEATHER_FORECAST_DAYS];   // Today, tomorrow
    int day_count;
};

// Parse a provider document; false with a short reason on any problem
bool parseWeatherReport(const std::string& json, WeatherReport& out, std::string& error);

// Request URL for a ZIP or place name (spaces become '+', others %-escaped)
std::string buildWeatherUrl(const std::string& location);

// Network forecast source. fetch() never throws: any network error, non-200
// status or parse failure returns false and sets lastError().
class WeatherProvider {
public:
    virtual ~WeatherProvider() {}

    // Credentials for the uplink are known
    virtual bool hasNetworkConfig() = 0;

    // Store credentials for later fetches
    virtual bool configureNetwork(const std::string& ssid, const std::string& password) = 0;

    // Drop stored credentials (factory reset)
    virtual bool forgetNetwork() = 0;

    // One bounded request for this location
    virtual bool fetch(const std::string& location, WeatherReport& out) = 0;

    virtual const std::string& lastError() const = 0;
};

#endif // WEATHER_H

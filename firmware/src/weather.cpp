/**
 * InkDeck - Weather
 * Document parsing (portable, no network code here)
 */

#include <ArduinoJson.h>
#include <stdio.h>
#include <stdlib.h>
#include "weather.h"
#include "config.h"

// Fields are strings in j1 documents, but accept plain numbers too
static int fieldInt(JsonVariantConst value) {
    if (value.is<const char*>()) {
        return atoi(value.as<const char*>());
    }
    return value | 0;
}

// {"areaName": [{"value": "..."}]} style wrapped strings
static std::string wrappedText(JsonVariantConst value) {
    const char* text = value[0]["value"] | "";
    return std::string(text);
}

static void buildFilter(JsonDocument& filter) {
    filter["nearest_area"][0]["areaName"][0]["value"] = true;
    filter["nearest_area"][0]["region"][0]["value"] = true;

    filter["current_condition"][0]["temp_F"] = true;
    filter["current_condition"][0]["FeelsLikeF"] = true;
    filter["current_condition"][0]["humidity"] = true;
    filter["current_condition"][0]["windspeedMiles"] = true;
    filter["current_condition"][0]["weatherCode"] = true;
    filter["current_condition"][0]["weatherDesc"][0]["value"] = true;

    filter["weather"][0]["date"] = true;
    filter["weather"][0]["maxtempF"] = true;
    filter["weather"][0]["mintempF"] = true;
    filter["weather"][0]["hourly"][0]["weatherCode"] = true;
    filter["weather"][0]["hourly"][0]["weatherDesc"][0]["value"] = true;
}

bool parseWeatherReport(const std::string& json, WeatherReport& out, std::string& error) {
    JsonDocument filter;
    buildFilter(filter);

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json, DeserializationOption::Filter(filter));
    if (err) {
        error = std::string("Bad response: ") + err.c_str();
        DEBUG_PRINTF(g_debug_weather, "Weather: JSON parse error: %s\n", err.c_str());
        return false;
    }

    JsonObjectConst current = doc["current_condition"][0];
    if (current.isNull()) {
        error = "No current conditions";
        return false;
    }

    out = WeatherReport();
    out.location = wrappedText(doc["nearest_area"][0]["areaName"]);
    out.region = wrappedText(doc["nearest_area"][0]["region"]);

    out.temp_f = fieldInt(current["temp_F"]);
    out.feels_like_f = fieldInt(current["FeelsLikeF"]);
    out.humidity = fieldInt(current["humidity"]);
    out.wind_mph = fieldInt(current["windspeedMiles"]);
    out.code = fieldInt(current["weatherCode"]);
    out.description = wrappedText(current["weatherDesc"]);

    out.day_count = 0;
    JsonArrayConst days = doc["weather"];
    for (JsonObjectConst entry : days) {
        if (out.day_count >= WEATHER_FORECAST_DAYS) {
            break;
        }
        WeatherDay& day = out.days[out.day_count];
        day.date = entry["date"] | "";
        day.max_f = fieldInt(entry["maxtempF"]);
        day.min_f = fieldInt(entry["mintempF"]);

        // Midday slot when the day has the usual 8 three-hour slots
        JsonArrayConst hourly = entry["hourly"];
        size_t slot = hourly.size() > WEATHER_MIDDAY_SLOT ? WEATHER_MIDDAY_SLOT : 0;
        day.code = fieldInt(hourly[slot]["weatherCode"]);
        day.description = wrappedText(hourly[slot]["weatherDesc"]);
        out.day_count++;
    }

    if (out.day_count == 0) {
        error = "No forecast data";
        return false;
    }

    DEBUG_PRINTF(g_debug_weather, "Weather: %s %dF code %d, %d forecast days\n",
                 out.location.c_str(), out.temp_f, out.code, out.day_count);
    return true;
}

std::string buildWeatherUrl(const std::string& location) {
    std::string url = WEATHER_URL_PREFIX;
    for (size_t i = 0; i < location.size(); ++i) {
        char c = location[i];
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                     (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == ',';
        if (plain) {
            url += c;
        } else if (c == ' ') {
            url += '+';
        } else {
            char escaped[4];
            snprintf(escaped, sizeof(escaped), "%%%02X", static_cast<unsigned char>(c));
            url += escaped;
        }
    }
    url += WEATHER_URL_SUFFIX;
    return url;
}

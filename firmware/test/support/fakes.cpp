// fakes.cpp
// In-memory stand-ins for the hardware interfaces

#include "fakes.h"
#include <algorithm>
#include <stdlib.h>
#include <string.h>

// ==================== FakeCanvas ====================

FakeCanvas::FakeCanvas(int16_t width, int16_t height)
    : width_(width), height_(height), pixels_(static_cast<size_t>(width) * height, 255) {}

void FakeCanvas::fillScreen(uint8_t color) {
    std::fill(pixels_.begin(), pixels_.end(), color);
    texts_.clear();
}

void FakeCanvas::drawPixel(int16_t x, int16_t y, uint8_t color) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    pixels_[static_cast<size_t>(y) * width_ + x] = color;
}

void FakeCanvas::drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, uint8_t color) {
    int dx = abs(x1 - x0), sx = x0 < x1 ? 1 : -1;
    int dy = -abs(y1 - y0), sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    for (;;) {
        drawPixel(x0, y0, color);
        if (x0 == x1 && y0 == y1) break;
        int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
}

void FakeCanvas::drawRect(int16_t x, int16_t y, int16_t w, int16_t h, uint8_t color) {
    if (w <= 0 || h <= 0) return;
    drawLine(x, y, x + w - 1, y, color);
    drawLine(x, y + h - 1, x + w - 1, y + h - 1, color);
    drawLine(x, y, x, y + h - 1, color);
    drawLine(x + w - 1, y, x + w - 1, y + h - 1, color);
}

void FakeCanvas::fillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint8_t color) {
    for (int16_t j = y; j < y + h; ++j) {
        for (int16_t i = x; i < x + w; ++i) {
            drawPixel(i, j, color);
        }
    }
}

void FakeCanvas::drawCircle(int16_t cx, int16_t cy, int16_t r, uint8_t color) {
    for (int16_t y = -r; y <= r; ++y) {
        for (int16_t x = -r; x <= r; ++x) {
            int d = x * x + y * y;
            if (d <= r * r && d > (r - 1) * (r - 1)) {
                drawPixel(cx + x, cy + y, color);
            }
        }
    }
}

void FakeCanvas::fillCircle(int16_t cx, int16_t cy, int16_t r, uint8_t color) {
    for (int16_t y = -r; y <= r; ++y) {
        for (int16_t x = -r; x <= r; ++x) {
            if (x * x + y * y <= r * r) {
                drawPixel(cx + x, cy + y, color);
            }
        }
    }
}

void FakeCanvas::drawText(int16_t x, int16_t y, const char* text, uint8_t size, uint8_t color) {
    texts_.push_back(text);
    int16_t cursor = x;
    for (const char* p = text; *p != '\0'; ++p) {
        if (*p != ' ') {
            fillRect(cursor, y, 5 * size, 7 * size, color);
        }
        cursor += 6 * size;
    }
}

int FakeCanvas::countPixels(uint8_t color) const {
    int count = 0;
    for (size_t i = 0; i < pixels_.size(); ++i) {
        if (pixels_[i] == color) count++;
    }
    return count;
}

bool FakeCanvas::hasText(const std::string& needle) const {
    for (size_t i = 0; i < texts_.size(); ++i) {
        if (texts_[i].find(needle) != std::string::npos) return true;
    }
    return false;
}

// ==================== MemoryFileStore ====================

bool MemoryFileStore::readFile(const std::string& path, std::string& out) {
    std::map<std::string, std::string>::const_iterator it = files.find(path);
    if (it == files.end()) return false;
    out = it->second;
    return true;
}

bool MemoryFileStore::writeFile(const std::string& path, const std::string& data) {
    if (fail_writes) return false;
    files[path] = data;
    writes++;
    return true;
}

bool MemoryFileStore::ensureDir(const std::string&) {
    return true;
}

// ==================== FakeClock ====================

FakeClock::FakeClock() : now_ms_(1000), time_set_(false), base_epoch_(0) {
    setTime(2026, 1, 5, 9, 41, 0);
}

void FakeClock::setTime(int year, int month, int day, int hour, int minute, int second) {
    struct tm value;
    memset(&value, 0, sizeof(value));
    value.tm_year = year - 1900;
    value.tm_mon = month - 1;
    value.tm_mday = day;
    value.tm_hour = hour;
    value.tm_min = minute;
    value.tm_sec = second;
    base_epoch_ = timegm(&value) - static_cast<time_t>(now_ms_ / 1000);
    time_set_ = true;
}

bool FakeClock::localTime(struct tm& out) {
    if (!time_set_) return false;
    time_t now = base_epoch_ + static_cast<time_t>(now_ms_ / 1000);
    return gmtime_r(&now, &out) != nullptr;
}

// ==================== ScriptedKeys ====================

bool ScriptedKeys::pollKey(KeyEvent& out, uint32_t timeout_ms) {
    if (queue.empty()) {
        clock_.advance(timeout_ms);
        return false;
    }
    out = queue.front();
    queue.pop_front();
    return true;
}

void ScriptedKeys::type(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        push(text[i]);
    }
}

// ==================== FakeSurface ====================

void FakeSurface::show(bool partial) {
    shows++;
    if (partial) {
        partial_shows++;
    } else {
        full_shows++;
    }
}

// ==================== FakeWeather ====================

FakeWeather::FakeWeather() : succeed(true), fetches(0) {
    report = WeatherReport();
    report.location = "Springfield";
    report.region = "Illinois";
    report.temp_f = 54;
    report.feels_like_f = 51;
    report.humidity = 62;
    report.wind_mph = 7;
    report.code = 116;
    report.description = "Partly cloudy";
    report.day_count = 2;
    report.days[0].date = "2026-01-05";
    report.days[0].max_f = 58;
    report.days[0].min_f = 41;
    report.days[0].code = 113;
    report.days[1].date = "2026-01-06";
    report.days[1].max_f = 49;
    report.days[1].min_f = 38;
    report.days[1].code = 296;
}

bool FakeWeather::configureNetwork(const std::string& new_ssid, const std::string& new_password) {
    ssid = new_ssid;
    password = new_password;
    return true;
}

bool FakeWeather::forgetNetwork() {
    ssid.clear();
    password.clear();
    return true;
}

bool FakeWeather::fetch(const std::string& location, WeatherReport& out) {
    fetches++;
    last_location = location;
    if (!succeed) {
        if (error.empty()) error = "Network: connection refused";
        return false;
    }
    out = report;
    return true;
}

// ==================== Sample Document ====================

const char* SAMPLE_WEATHER_JSON = R"JSON({
  "current_condition": [{
    "FeelsLikeF": "51", "humidity": "62", "temp_F": "54", "temp_C": "12",
    "weatherCode": "116", "weatherDesc": [{"value": "Partly cloudy"}],
    "windspeedMiles": "7", "winddir16Point": "SW"
  }],
  "nearest_area": [{
    "areaName": [{"value": "Springfield"}],
    "country": [{"value": "United States of America"}],
    "region": [{"value": "Illinois"}]
  }],
  "request": [{"query": "62701", "type": "Zipcode"}],
  "weather": [
    {
      "date": "2026-01-05", "maxtempF": "58", "mintempF": "41",
      "astronomy": [{"sunrise": "07:18 AM"}],
      "hourly": [
        {"time": "0", "weatherCode": "113", "weatherDesc": [{"value": "Clear"}]},
        {"time": "300", "weatherCode": "113", "weatherDesc": [{"value": "Clear"}]},
        {"time": "600", "weatherCode": "116", "weatherDesc": [{"value": "Partly cloudy"}]},
        {"time": "900", "weatherCode": "116", "weatherDesc": [{"value": "Partly cloudy"}]},
        {"time": "1200", "weatherCode": "113", "weatherDesc": [{"value": "Sunny"}]},
        {"time": "1500", "weatherCode": "113", "weatherDesc": [{"value": "Sunny"}]},
        {"time": "1800", "weatherCode": "119", "weatherDesc": [{"value": "Cloudy"}]},
        {"time": "2100", "weatherCode": "119", "weatherDesc": [{"value": "Cloudy"}]}
      ]
    },
    {
      "date": "2026-01-06", "maxtempF": "49", "mintempF": "38",
      "hourly": [
        {"time": "0", "weatherCode": "122", "weatherDesc": [{"value": "Overcast"}]},
        {"time": "300", "weatherCode": "122", "weatherDesc": [{"value": "Overcast"}]},
        {"time": "600", "weatherCode": "176", "weatherDesc": [{"value": "Patchy rain possible"}]},
        {"time": "900", "weatherCode": "296", "weatherDesc": [{"value": "Light rain"}]},
        {"time": "1200", "weatherCode": "296", "weatherDesc": [{"value": "Light rain"}]},
        {"time": "1500", "weatherCode": "296", "weatherDesc": [{"value": "Light rain"}]},
        {"time": "1800", "weatherCode": "122", "weatherDesc": [{"value": "Overcast"}]},
        {"time": "2100", "weatherCode": "122", "weatherDesc": [{"value": "Overcast"}]}
      ]
    },
    {
      "date": "2026-01-07", "maxtempF": "45", "mintempF": "30",
      "hourly": [
        {"time": "1200", "weatherCode": "338", "weatherDesc": [{"value": "Heavy snow"}]}
      ]
    }
  ]
})JSON";

/**
 * Pin definitions for Adafruit ESP32 Feather V2 + 2.13" E-Paper FeatherWing
 *
 * I2C devices (STEMMA QT / Qwiic):
 *   - DS3231 RTC: 0x68 (optional)
 *
 * E-Paper FeatherWing connects via SPI (directly stacked)
 * Keyboard arrives over the USB serial console
 */

#ifndef PINS_ADAFRUIT_H
#define PINS_ADAFRUIT_H

// I2C pins (STEMMA QT connector)
#define PIN_I2C_SDA         22
#define PIN_I2C_SCL         20

// E-Paper FeatherWing SPI pins (directly stacked)
#define PIN_EPD_DC          33
#define PIN_EPD_CS          15
#define PIN_EPD_BUSY        -1  // Not connected on FeatherWing
#define PIN_SRAM_CS         32
#define PIN_EPD_RESET       -1  // Not connected on FeatherWing

// Onboard LED (lit while a weather fetch is in flight)
#define PIN_LED             13

#endif // PINS_ADAFRUIT_H

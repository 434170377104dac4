/**
 * InkDeck - E-Ink Clock, Notes and Weather Firmware
 * Common definitions and configuration
 */

#ifndef INKDECK_H
#define INKDECK_H

#include <Arduino.h>

#include "config.h"

// Include board-specific pin definitions
#if defined(BOARD_ADAFRUIT_FEATHER)
    #include "config/pins_adafruit.h"
#else
    #error "No board defined! Use -DBOARD_ADAFRUIT_FEATHER"
#endif

#endif // INKDECK_H

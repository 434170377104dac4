/**
 * InkDeck - Runtime Debug Flags
 * Non-persistent, reset to the config.h defaults on boot
 */

#include "config.h"

// Global enable flag
bool g_debug_enabled = DEBUG_ENABLED;

// Individual category flags
bool g_debug_display = DEBUG_DISPLAY_UPDATES;
bool g_debug_input = DEBUG_INPUT;
bool g_debug_storage = DEBUG_STORAGE;
bool g_debug_weather = DEBUG_WEATHER;
bool g_debug_ui = DEBUG_UI;

// src/config/system_config.hpp
#pragma once

#if defined(ARDUINO) && ARDUINO >= 100
// Arduino implementations
#include <Arduino.h>

#define S2LP_BUILD_ARDUINO
#else
// Native implementation
#include <stdio.h>
#define S2LP_BUILD_NATIVE
#endif

#ifndef S2LP_LOG_LEVEL
#define S2LP_LOG_LEVEL 0  // 0=DEBUG, 1=INFO, 2=WARNING, 3=ERROR, 4=NO_LOG
#endif
//#define LOGGER_DISABLE_COLORS   // Disable color output
#define LOGGER_BUFFER_SIZE 128  // Adjust buffer size for your needs

// Time a single TX wait iteration blocks on the IRQ line before checking
// the chip state
#define S2LP_TX_WAIT_TIMEOUT_MS 1000

// Worst case boot time when the IRQ line is not wired to GPIO0
#define S2LP_BOOT_DELAY_MS 2

// Upper bound of state register polls before giving up
#define S2LP_STATE_POLL_ATTEMPTS 1000
#define S2LP_STATE_POLL_INTERVAL_US 10

/**
 * @file s2lp.hpp
 * @brief Main S2-LP driver interface
 */
#pragma once

#include "config/system_config.hpp"
#include "hardware/hal.hpp"
#include "hardware/s2lp/device.hpp"
#include "hardware/s2lp/registers.hpp"
#include "hardware/s2lp/spi_register_interface.hpp"
#include "radio/rf_parameters.hpp"
#include "radio/s2lp_radio.hpp"
#include "types/configurations/radio_configuration.hpp"
#include "types/error_codes/result.hpp"
#include "types/packet_formats/basic_format.hpp"
#include "types/packet_formats/ieee802154g_format.hpp"
#include "types/packet_formats/packet_filtering_options.hpp"
#include "types/radio/csma_ca.hpp"
#include "types/radio/gpio_function.hpp"
#include "types/radio/radio_results.hpp"
#include "types/radio/radio_state.hpp"
#include "types/radio/rx_mode.hpp"
#include "utils/logger.hpp"

#ifdef S2LP_BUILD_NATIVE
#include "hal/native/native_hal.hpp"
#endif

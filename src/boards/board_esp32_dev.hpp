// src/boards/board_esp32_dev.hpp
#ifndef BOARD_ESP32_DEV_HPP
#define BOARD_ESP32_DEV_HPP

// --- ESP32 DevKit V1 ---

// UART2 ligada à placa de sensores/relés
#define GATEWAY_UART_NUM 2
#define GATEWAY_RX_PIN 16
#define GATEWAY_TX_PIN 17
#define GATEWAY_BAUD 115200

// LED de status (acende quando o loop climático está em auto)
#define STATUS_LED_PIN 2

#ifdef UNIT_TEST
    #define DEVICE_NAME "grow-climate-test"
#else
    #define DEVICE_NAME "grow-climate-01"
#endif

#endif // BOARD_ESP32_DEV_HPP

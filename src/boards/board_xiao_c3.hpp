// src/boards/board_xiao_c3.hpp
#ifndef BOARD_XIAO_C3_HPP
#define BOARD_XIAO_C3_HPP

// --- Seeed Studio XIAO ESP32-C3 ---

// O C3 só tem UART0 (USB/console) e UART1 livre
#define GATEWAY_UART_NUM 1
#define GATEWAY_RX_PIN 20 // (D7)
#define GATEWAY_TX_PIN 21 // (D6)
#define GATEWAY_BAUD 115200

#define STATUS_LED_PIN 10 // (D10)

#ifdef UNIT_TEST
    #define DEVICE_NAME "grow-climate-c3-test"
#else
    #define DEVICE_NAME "grow-climate-c3"
#endif

#endif // BOARD_XIAO_C3_HPP

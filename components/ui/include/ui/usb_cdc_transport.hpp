/**
 * @file usb_cdc_transport.hpp
 * @brief ConsoleTransport over an esp_tinyusb CDC ACM port
 *
 * The TinyUSB driver and the CDC ports are installed by the boot pipeline
 * (app::UsbConsolePhase); this class only reads and writes.
 */

#pragma once

#include "ui/console_transport.hpp"
#include "tinyusb_cdc_acm.h"

namespace ui {

class UsbCdcTransport : public ConsoleTransport {
public:
    explicit UsbCdcTransport(tinyusb_cdcacm_itf_t port = TINYUSB_CDC_ACM_1) : port_(port) {}

    size_t Read(char* buf, size_t len) override;
    void Write(const char* data, size_t len) override;

private:
    tinyusb_cdcacm_itf_t port_;
};

} // namespace ui

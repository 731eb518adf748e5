/**
 * @file usb_cdc_transport.cpp
 * @brief USB-CDC console transport
 */

#include "ui/usb_cdc_transport.hpp"

#include <cstdint>

extern "C" {
#include "esp_log.h"
}

namespace ui {

static const char* TAG = "UsbCdcTransport";

// Retries when the TinyUSB TX FIFO is full (no terminal attached or host not reading)
static constexpr int WRITE_RETRIES = 2;
static constexpr uint32_t FLUSH_WAIT_TICKS = 1;

size_t UsbCdcTransport::Read(char* buf, size_t len) {
    if (!tinyusb_cdcacm_initialized(port_)) {
        return 0;
    }
    size_t rx_size = 0;
    esp_err_t err = tinyusb_cdcacm_read(port_, reinterpret_cast<uint8_t*>(buf), len, &rx_size);
    if (err != ESP_OK) {
        return 0;  // No data available
    }
    return rx_size;
}

void UsbCdcTransport::Write(const char* data, size_t len) {
    if (!tinyusb_cdcacm_initialized(port_)) {
        return;
    }
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
    int retries = 0;
    while (len > 0) {
        const size_t queued = tinyusb_cdcacm_write_queue(port_, bytes, len);
        bytes += queued;
        len -= queued;
        // Non-blocking flush, unless the FIFO was full: then give the host a moment
        const esp_err_t err = tinyusb_cdcacm_write_flush(port_, queued == 0 ? FLUSH_WAIT_TICKS : 0);
        if (queued == 0 && ++retries > WRITE_RETRIES) {
            ESP_LOGD(TAG, "CDC%d TX stalled (%s), dropped %u bytes", static_cast<int>(port_),
                     esp_err_to_name(err), static_cast<unsigned>(len));
            return;
        }
    }
}

} // namespace ui

/**
 * @file console_transport.hpp
 * @brief Byte transport underneath the serial console
 *
 * The console never talks to a driver directly. On the device the transport
 * is UsbCdcTransport (TINYUSB_CDC_ACM_1); host tests plug in a scripted
 * in-memory transport.
 */

#pragma once

#include <cstddef>

namespace ui {

class ConsoleTransport {
public:
    virtual ~ConsoleTransport() = default;

    /**
     * Non-blocking read.
     * @return Number of bytes copied into @p buf (0 = nothing pending)
     */
    virtual size_t Read(char* buf, size_t len) = 0;

    /**
     * Queue bytes for output and flush without blocking.
     */
    virtual void Write(const char* data, size_t len) = 0;
};

} // namespace ui

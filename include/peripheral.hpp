/**
 * peripheral.hpp
 *
 * Connection points between device models and the bus/GPIO fabric
 * that drives them.
 */

#ifndef PERIPHERAL_HPP
#define PERIPHERAL_HPP

#include "common.hpp"

class SpiPeripheral {
public:
    virtual ~SpiPeripheral() = default;

    // One byte in, one byte out, while chip select is asserted
    virtual Byte transmit(Byte data) = 0;

    // Chip select released
    virtual void finish_transmission() = 0;
};

class GpioReceiver {
public:
    virtual ~GpioReceiver() = default;

    virtual void on_gpio(int pin, bool level) = 0;
};

// Target of the STM32H7 DBP (disable backup protection) bit
class BackupDomain {
public:
    virtual ~BackupDomain() = default;

    virtual void set_write_access(bool enabled) = 0;
};

#endif // PERIPHERAL_HPP

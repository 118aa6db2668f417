#pragma once

#include <QString>

// Limit switches on the jack and the trap. Display only.
struct PinStates {
    bool retracted = false;
    bool extended = false;
    bool open = false;
    bool closed = false;

    bool operator==(const PinStates& other) const {
        return retracted == other.retracted && extended == other.extended
            && open == other.open && closed == other.closed;
    }
    bool operator!=(const PinStates& other) const { return !(*this == other); }
};

class PositionSensor {
public:
    virtual ~PositionSensor() = default;

    // True when fresh pin states arrived since the last call
    virtual bool readPins(PinStates& pins) = 0;
    virtual bool isAvailable() const = 0;
};

#pragma once

#include "../core/regenconstants.h"

// Connectivity bookkeeping for one device. The engine owns one per device
// and feeds it the outcome of every read.
struct DeviceHealth {
    int consecutiveFailures = 0;
    int totalFailures = 0;
    bool connected = true;

    // Returns true when the connected flag flipped
    bool record(bool success, int threshold = Regen::DEVICE_FAILURE_THRESHOLD) {
        bool wasConnected = connected;
        if (success) {
            consecutiveFailures = 0;
            connected = true;
        } else {
            ++consecutiveFailures;
            ++totalFailures;
            if (consecutiveFailures >= threshold) {
                connected = false;
            }
        }
        return wasConnected != connected;
    }

    void reset() {
        consecutiveFailures = 0;
        totalFailures = 0;
        connected = true;
    }
};

#include "LoRaWANTypes.hpp"

uint32_t bandwidthHz(Bandwidth bw) {
    switch (bw) {
    case Bandwidth::BW125:
        return 125000;
    case Bandwidth::BW250:
        return 250000;
    case Bandwidth::BW500:
        return 500000;
    }
    return 125000;
}

Frequency Frequency::fromHz(uint32_t hz) {
    if (hz % 100 != 0 || hz / 100 > 0xFFFFFF) {
        throw CodecError(CodecError::InvalidFrequency,
                         "Frequency " + std::to_string(hz) + " Hz cannot be encoded");
    }
    uint32_t units = hz / 100;
    uint8_t bytes[3] = {
        static_cast<uint8_t>(units & 0xFF),
        static_cast<uint8_t>((units >> 8) & 0xFF),
        static_cast<uint8_t>((units >> 16) & 0xFF)
    };
    return Frequency(bytes);
}

DLSettings DLSettings::make(uint8_t rx1DrOffset, uint8_t rx2DataRate) {
    if (rx1DrOffset > 0x07 || rx2DataRate > 0x0F) {
        throw CodecError(CodecError::InvalidDataRate, "DLSettings: field out of range");
    }
    return DLSettings(static_cast<uint8_t>((rx1DrOffset << 4) | rx2DataRate));
}

DataRateRange DataRateRange::make(uint8_t minDataRate, uint8_t maxDataRate) {
    if (minDataRate > 0x0F || maxDataRate > 0x0F) {
        throw CodecError(CodecError::InvalidDataRate, "DataRateRange: data rate out of range");
    }
    return DataRateRange(static_cast<uint8_t>((maxDataRate << 4) | minDataRate));
}

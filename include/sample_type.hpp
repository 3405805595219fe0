#pragma once

#include <cstddef>
#include <cstdint>

namespace cog_converter {

// バンドごとのサンプル型
enum class SampleType { UInt8, Int8, UInt16, Int16, UInt32, Int32, Float32, Float64, Unknown };

inline bool is_floating_point(SampleType type) {
    return type == SampleType::Float32 || type == SampleType::Float64;
}

inline std::size_t bytes_per_sample(SampleType type) {
    switch (type) {
        case SampleType::UInt8:
        case SampleType::Int8:
            return 1;
        case SampleType::UInt16:
        case SampleType::Int16:
            return 2;
        case SampleType::UInt32:
        case SampleType::Int32:
        case SampleType::Float32:
            return 4;
        case SampleType::Float64:
            return 8;
        case SampleType::Unknown:
            break;
    }
    return 0;
}

inline const char* to_string(SampleType type) {
    switch (type) {
        case SampleType::UInt8:
            return "uint8";
        case SampleType::Int8:
            return "int8";
        case SampleType::UInt16:
            return "uint16";
        case SampleType::Int16:
            return "int16";
        case SampleType::UInt32:
            return "uint32";
        case SampleType::Int32:
            return "int32";
        case SampleType::Float32:
            return "float32";
        case SampleType::Float64:
            return "float64";
        case SampleType::Unknown:
            break;
    }
    return "unknown";
}

}  // namespace cog_converter

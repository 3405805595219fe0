#include "raster.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <type_traits>

namespace cog_converter {

namespace {

template <typename T>
double load(const std::uint8_t* p) {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return static_cast<double>(v);
}

template <typename T>
void store(std::uint8_t* p, double v) {
    if constexpr (std::is_integral_v<T>) {
        if (std::isnan(v)) {
            v = 0.0;
        }
        v = std::round(v);
        v = std::clamp(v, static_cast<double>(std::numeric_limits<T>::lowest()),
                       static_cast<double>(std::numeric_limits<T>::max()));
    }
    const T t = static_cast<T>(v);
    std::memcpy(p, &t, sizeof(T));
}

double load_sample(SampleType type, const std::uint8_t* p) {
    switch (type) {
        case SampleType::UInt8:
            return load<std::uint8_t>(p);
        case SampleType::Int8:
            return load<std::int8_t>(p);
        case SampleType::UInt16:
            return load<std::uint16_t>(p);
        case SampleType::Int16:
            return load<std::int16_t>(p);
        case SampleType::UInt32:
            return load<std::uint32_t>(p);
        case SampleType::Int32:
            return load<std::int32_t>(p);
        case SampleType::Float32:
            return load<float>(p);
        case SampleType::Float64:
            return load<double>(p);
        case SampleType::Unknown:
            break;
    }
    return 0.0;
}

void store_sample(SampleType type, std::uint8_t* p, double v) {
    switch (type) {
        case SampleType::UInt8:
            store<std::uint8_t>(p, v);
            break;
        case SampleType::Int8:
            store<std::int8_t>(p, v);
            break;
        case SampleType::UInt16:
            store<std::uint16_t>(p, v);
            break;
        case SampleType::Int16:
            store<std::int16_t>(p, v);
            break;
        case SampleType::UInt32:
            store<std::uint32_t>(p, v);
            break;
        case SampleType::Int32:
            store<std::int32_t>(p, v);
            break;
        case SampleType::Float32:
            store<float>(p, v);
            break;
        case SampleType::Float64:
            store<double>(p, v);
            break;
        case SampleType::Unknown:
            break;
    }
}

}  // namespace

Raster::Raster(std::uint32_t width, std::uint32_t height, int bands, SampleType type)
    : width(width), height(height), bands(bands), type(type) {
    data.resize(static_cast<std::size_t>(width) * height * bands * bytes_per_sample(type));
}

double Raster::value(std::uint32_t x, std::uint32_t y, int band) const {
    return load_sample(type, pixel(x, y) + static_cast<std::size_t>(band) * sample_bytes());
}

void Raster::set_value(std::uint32_t x, std::uint32_t y, int band, double v) {
    store_sample(type, pixel(x, y) + static_cast<std::size_t>(band) * sample_bytes(), v);
}

void Raster::fill(double v) {
    if (data.empty()) {
        return;
    }
    // 先頭ピクセルを作ってから複製する
    for (int b = 0; b < bands; ++b) {
        set_value(0, 0, b, v);
    }
    const std::size_t pb = pixel_bytes();
    for (std::size_t offset = pb; offset < data.size(); offset += pb) {
        std::memcpy(data.data() + offset, data.data(), pb);
    }
}

}  // namespace cog_converter

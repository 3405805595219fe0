#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "sample_type.hpp"

namespace cog_converter {

// メモリ上のラスター（ピクセルインターリーブ、行優先: (y * width + x) * bands + band）
struct Raster {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    int bands = 0;
    SampleType type = SampleType::Unknown;
    std::vector<std::uint8_t> data;

    Raster() = default;
    Raster(std::uint32_t width, std::uint32_t height, int bands, SampleType type);

    std::size_t sample_bytes() const { return bytes_per_sample(type); }
    std::size_t pixel_bytes() const { return sample_bytes() * static_cast<std::size_t>(bands); }
    std::size_t row_bytes() const { return pixel_bytes() * width; }

    std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) {
        return data.data() + (static_cast<std::size_t>(y) * width + x) * pixel_bytes();
    }
    const std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) const {
        return data.data() + (static_cast<std::size_t>(y) * width + x) * pixel_bytes();
    }

    double value(std::uint32_t x, std::uint32_t y, int band) const;
    // 整数型では丸めて型の範囲にクランプする
    void set_value(std::uint32_t x, std::uint32_t y, int band, double v);
    void fill(double v);
};

}  // namespace cog_converter

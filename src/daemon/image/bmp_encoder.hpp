#pragma once

#include "image/frame.hpp"

#include <cstdint>
#include <cstring>
#include <vector>

// Encodes an RGB frame as an uncompressed 24-bit BMP in memory.
namespace bmp {

inline std::vector<uint8_t> encode(const Frame& frame) {
    if (frame.empty()) return {};

    uint32_t row_stride = (static_cast<uint32_t>(frame.width) * 3 + 3) & ~3u;
    uint32_t data_size = row_stride * static_cast<uint32_t>(frame.height);
    uint32_t file_size = 54 + data_size;

    std::vector<uint8_t> out(file_size, 0);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("BM", 2);
    w32(file_size);
    w32(0);                 // reserved
    w32(54);                // pixel data offset
    w32(40);                // BITMAPINFOHEADER size
    w32(static_cast<uint32_t>(frame.width));
    w32(static_cast<uint32_t>(frame.height));  // positive: bottom-up rows
    w16(1);                 // planes
    w16(24);                // bits per pixel
    w32(0);                 // BI_RGB
    w32(data_size);
    w32(2835);              // 72 dpi
    w32(2835);
    w32(0);
    w32(0);

    for (int y = 0; y < frame.height; y++) {
        uint8_t* row = out.data() + 54 + static_cast<size_t>(frame.height - 1 - y) * row_stride;
        for (int x = 0; x < frame.width; x++) {
            const uint8_t* p = frame.pixel(x, y);
            row[x * 3] = p[2];
            row[x * 3 + 1] = p[1];
            row[x * 3 + 2] = p[0];
        }
    }

    return out;
}

} // namespace bmp

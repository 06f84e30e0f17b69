#pragma once

#include "../types/device.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace pixels {

// Handle to a die for connected use, one per pixel id
class Pixel {
public:
    explicit Pixel(ScannedPixel scanned);

    uint32_t pixel_id() const { return scanned_.pixel_id; }
    const std::string& name() const { return scanned_.name; }
    const PeripheralHandle& peripheral() const { return scanned_.peripheral; }

    // Snapshot the handle was created from
    const ScannedPixel& scanned_pixel() const { return scanned_; }

private:
    ScannedPixel scanned_;
};

// Pixel handles keyed by pixel id. Entries are kept for the registry's
// lifetime, independently of the scan list.
class PixelRegistry {
public:
    // Returns the existing handle for scanned.pixel_id or creates one
    std::shared_ptr<Pixel> get_or_create(const ScannedPixel& scanned);

    std::shared_ptr<Pixel> find(uint32_t pixel_id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint32_t, std::shared_ptr<Pixel>> pixels_;
};

} // namespace pixels

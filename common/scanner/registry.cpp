#include "registry.hpp"
#include <iostream>
#include <utility>

namespace pixels {

Pixel::Pixel(ScannedPixel scanned) : scanned_(std::move(scanned)) {}

std::shared_ptr<Pixel> PixelRegistry::get_or_create(const ScannedPixel& scanned) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pixels_.find(scanned.pixel_id);
    if (it != pixels_.end()) {
        return it->second;
    }

    auto pixel = std::make_shared<Pixel>(scanned);
    pixels_.emplace(scanned.pixel_id, pixel);
    std::cout << "scanner: created handle for " << format_pixel_id(scanned.pixel_id) << std::endl;
    return pixel;
}

std::shared_ptr<Pixel> PixelRegistry::find(uint32_t pixel_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pixels_.find(pixel_id);
    return it != pixels_.end() ? it->second : nullptr;
}

size_t PixelRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pixels_.size();
}

} // namespace pixels

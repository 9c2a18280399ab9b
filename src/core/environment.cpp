/**
 * @file environment.cpp
 * @brief Shared behaviour of environment backends
 *
 * @date 2025
 */

#include "monolith/core/environment.hpp"

#include <spdlog/spdlog.h>

namespace monolith {
namespace core {

bool EnvironmentBackend::RemoveImageIfUnused(const ImageRef& image) {
    if (IsImageInUse(image.id)) {
        spdlog::info("Image {} is in use by other environments. Skipping removal..", image.tag);
        return false;
    }
    return RemoveImage(image);
}

} // namespace core
} // namespace monolith

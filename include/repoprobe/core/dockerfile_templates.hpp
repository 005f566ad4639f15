/**
 * @file dockerfile_templates.hpp
 * @brief Minimal Dockerfile templates keyed by language family
 *
 * Each template contains exactly one `{start_command}` placeholder that
 * receives the exec-form CMD array.
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/core/sandbox_types.hpp"

#include <string>
#include <vector>

namespace repoprobe {
namespace core {

/// Placeholder substituted with the rendered CMD array
inline constexpr const char* kStartCommandPlaceholder = "{start_command}";

/**
 * @struct DockerfileTemplate
 * @brief One template entry
 */
struct DockerfileTemplate {
    Language language;
    std::string base_image;            ///< FROM line image
    std::vector<int> exposed_ports;    ///< Ports listed on the EXPOSE line
    std::string body;                  ///< Full text with placeholder
};

/**
 * @brief Template for a language family
 *
 * Every Language value has an entry; GENERIC is the fallback.
 */
const DockerfileTemplate& GetDockerfileTemplate(Language language);

} // namespace core
} // namespace repoprobe

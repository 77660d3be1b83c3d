#ifndef ARBITER_PROCESS_SERVICE_TYPE_HPP
#define ARBITER_PROCESS_SERVICE_TYPE_HPP
/**
 * @file ServiceType.hpp
 * @brief Identity of a GPU-bound workload family.
 *
 * Primary is the default, latency-sensitive service (text generation).
 * Secondary is the resource-intensive service that preempts it (image
 * generation). Other is a catch-all with no managed process.
 */

#include <cstdint>     // std::uint8_t
#include <optional>    // std::optional
#include <string_view> // std::string_view

namespace arbiter {

namespace process {

enum class ServiceType : std::uint8_t {
  Primary = 0,
  Secondary = 1,
  Other = 2,
};

/// @brief Stable lowercase name ("primary", "secondary", "other").
[[nodiscard]] std::string_view toString(ServiceType type) noexcept;

/**
 * @brief Parse a name produced by toString(). Case-insensitive.
 * @return std::nullopt for unknown names.
 */
[[nodiscard]] std::optional<ServiceType> parseServiceType(std::string_view name) noexcept;

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_SERVICE_TYPE_HPP

/**
 * @file ServiceType.cpp
 * @brief ServiceType names.
 */

#include "src/process/inc/ServiceType.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <array>

namespace arbiter {

namespace process {

std::string_view toString(ServiceType type) noexcept {
  switch (type) {
  case ServiceType::Primary:
    return "primary";
  case ServiceType::Secondary:
    return "secondary";
  case ServiceType::Other:
    break;
  }
  return "other";
}

std::optional<ServiceType> parseServiceType(std::string_view name) noexcept {
  static constexpr std::array<ServiceType, 3> ALL{ServiceType::Primary, ServiceType::Secondary,
                                                  ServiceType::Other};
  for (const ServiceType TYPE : ALL) {
    if (helpers::strings::iequals(name, toString(TYPE))) {
      return TYPE;
    }
  }
  return std::nullopt;
}

} // namespace process

} // namespace arbiter

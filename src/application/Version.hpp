/**
 * @file Version.hpp
 * @brief Program version reported by --version and the ProgramVersionString property.
 */

#pragma once

namespace geoflow::application {

inline constexpr const char* kVersionString = "0.1.0";

} // namespace geoflow::application

#pragma once

/**
 * @file UnitParser.hpp
 * @brief Linear unit names and conversion factors
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <optional>
#include <string>
#include <stdexcept>
#include <utility>

namespace demforge {

/**
 * @brief Exception thrown when unit parsing fails
 */
class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& message)
        : std::runtime_error("Unit parsing error: " + message) {}
};

/**
 * @brief Linear units for elevations and ground distances
 */
enum class LengthUnit {
    METERS,          // m
    FEET,            // ft (international, 0.3048 m)
    US_SURVEY_FEET   // us-ft (1200/3937 m)
};

/**
 * @brief Units volumes are reported in
 */
enum class VolumeUnit {
    CUBIC_METERS,    // m3
    CUBIC_FEET,      // ft3
    CUBIC_YARDS      // yd3
};

/**
 * @brief Result of parsing a length with an optional unit suffix
 */
struct ParsedLength {
    double value;              // Value in the requested canonical unit
    LengthUnit original_unit;  // Unit that was parsed
    bool had_explicit_unit;    // Whether a suffix was given

    ParsedLength(double v, LengthUnit u, bool explicit_unit = false)
        : value(v), original_unit(u), had_explicit_unit(explicit_unit) {}
};

/**
 * @brief Parses elevation units, lengths and conversion factors
 *
 * Examples:
 *   --factor 3.28084          multiply elevations by 3.28084
 *   --factor m:ft             derive the factor from unit names
 *   --resolution 3ft          pixel size given with a unit
 *   --volume-units yd3        report cut/fill in cubic yards
 */
class UnitParser {
public:
    // ========================================================================
    // LENGTH PARSING
    // ========================================================================

    /**
     * @brief Parse a length with optional unit suffix
     *
     * @param input String to parse (e.g., "2", "2m", "6.5ft")
     * @param default_unit Unit assumed when no suffix is given
     * @param canonical_unit Unit of the returned value
     *
     * Examples:
     *   parse_length("10ft", METERS, METERS) -> 3.048
     *   parse_length("3", FEET, FEET) -> 3.0
     */
    static ParsedLength parse_length(const std::string& input,
                                     LengthUnit default_unit,
                                     LengthUnit canonical_unit);

    /**
     * @brief Parse a multiplication factor for the unit conversion pass
     *
     * Accepts a plain number ("3.28084") or a "from:to" pair of unit
     * names ("m:ft", "ft:m", "us-ft:m").
     * @throws UnitParseError for zero, non-finite or malformed input
     */
    static double parse_conversion_factor(const std::string& input);

    // ========================================================================
    // UNIT CONVERSION
    // ========================================================================

    /**
     * @brief Factor that converts an elevation from one unit to another
     */
    static double vertical_factor(LengthUnit from_unit, LengthUnit to_unit);

    static double convert_length(double value, LengthUnit from_unit, LengthUnit to_unit);

    /**
     * @brief Get conversion factor to meters
     */
    static double to_meters_factor(LengthUnit unit);

    /**
     * @brief Divisor turning (length unit)^3 into the report volume unit
     *
     * Cell areas and elevation differences are both in @p length_unit, so
     * sum(diff) * cell_area is a volume in length_unit^3. For feet and
     * cubic yards this is 27.
     */
    static double volume_divisor(LengthUnit length_unit, VolumeUnit volume_unit);

    /**
     * @brief Parse unit string to LengthUnit enum
     * @throws UnitParseError if unit string is not recognized
     */
    static LengthUnit parse_length_unit(const std::string& unit_str);

    /**
     * @brief Parse unit string to VolumeUnit enum ("yd3", "cubic yards", ...)
     * @throws UnitParseError if unit string is not recognized
     */
    static VolumeUnit parse_volume_unit(const std::string& unit_str);

    static std::string unit_to_string(LengthUnit unit);

    /**
     * @brief Label used in volume reports ("cubic yards")
     */
    static std::string volume_label(VolumeUnit unit);

private:
    /**
     * @brief Split numeric value and unit suffix
     *
     * Examples:
     *   "200" -> ("200", "")
     *   "5ft" -> ("5", "ft")
     *   "1.5 us-ft" -> ("1.5", "us-ft")
     */
    static std::pair<std::string, std::string> split_value_and_unit(const std::string& input);
};

} // namespace demforge

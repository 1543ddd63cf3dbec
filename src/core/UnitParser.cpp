/**
 * @file UnitParser.cpp
 * @brief Linear unit names and conversion factors
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "UnitParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace demforge {

namespace {

std::string normalize(const std::string& text) {
    std::string lower = text;
    lower.erase(0, lower.find_first_not_of(" \t\n\r"));
    lower.erase(lower.find_last_not_of(" \t\n\r") + 1);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower;
}

} // namespace

// ============================================================================
// UNIT CONVERSION
// ============================================================================

double UnitParser::to_meters_factor(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::METERS:         return 1.0;
        case LengthUnit::FEET:           return 0.3048;
        case LengthUnit::US_SURVEY_FEET: return 1200.0 / 3937.0;
    }
    throw UnitParseError("Unknown length unit in to_meters_factor");
}

double UnitParser::vertical_factor(LengthUnit from_unit, LengthUnit to_unit) {
    if (from_unit == to_unit) {
        return 1.0;
    }
    return to_meters_factor(from_unit) / to_meters_factor(to_unit);
}

double UnitParser::convert_length(double value, LengthUnit from_unit, LengthUnit to_unit) {
    if (from_unit == to_unit) {
        return value;
    }

    // Convert to meters first, then to target unit
    double in_meters = value * to_meters_factor(from_unit);
    return in_meters / to_meters_factor(to_unit);
}

double UnitParser::volume_divisor(LengthUnit length_unit, VolumeUnit volume_unit) {
    switch (volume_unit) {
        case VolumeUnit::CUBIC_METERS:
            return std::pow(to_meters_factor(LengthUnit::METERS) / to_meters_factor(length_unit), 3);
        case VolumeUnit::CUBIC_FEET:
            if (length_unit == LengthUnit::FEET) return 1.0;
            return std::pow(to_meters_factor(LengthUnit::FEET) / to_meters_factor(length_unit), 3);
        case VolumeUnit::CUBIC_YARDS:
            // A yard is exactly three international feet
            if (length_unit == LengthUnit::FEET) return 27.0;
            return std::pow(3.0 * to_meters_factor(LengthUnit::FEET) / to_meters_factor(length_unit), 3);
    }
    throw UnitParseError("Unknown volume unit in volume_divisor");
}

LengthUnit UnitParser::parse_length_unit(const std::string& unit_str) {
    std::string lower_unit = normalize(unit_str);

    if (lower_unit == "m" || lower_unit == "meter" || lower_unit == "meters" ||
        lower_unit == "metre" || lower_unit == "metres") {
        return LengthUnit::METERS;
    } else if (lower_unit == "ft" || lower_unit == "foot" || lower_unit == "feet") {
        return LengthUnit::FEET;
    } else if (lower_unit == "us-ft" || lower_unit == "usft" || lower_unit == "us_survey_feet" ||
               lower_unit == "us survey feet") {
        return LengthUnit::US_SURVEY_FEET;
    }

    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. " +
                         "Supported units: m, ft, us-ft");
}

VolumeUnit UnitParser::parse_volume_unit(const std::string& unit_str) {
    std::string lower_unit = normalize(unit_str);

    if (lower_unit == "m3" || lower_unit == "cubic meters" || lower_unit == "cubic metres") {
        return VolumeUnit::CUBIC_METERS;
    } else if (lower_unit == "ft3" || lower_unit == "cubic feet") {
        return VolumeUnit::CUBIC_FEET;
    } else if (lower_unit == "yd3" || lower_unit == "cubic yards") {
        return VolumeUnit::CUBIC_YARDS;
    }

    throw UnitParseError("Unrecognized volume unit: '" + unit_str + "'. " +
                         "Supported units: m3, ft3, yd3");
}

std::string UnitParser::unit_to_string(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::METERS:         return "m";
        case LengthUnit::FEET:           return "ft";
        case LengthUnit::US_SURVEY_FEET: return "us-ft";
    }
    return "unknown";
}

std::string UnitParser::volume_label(VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::CUBIC_METERS: return "cubic meters";
        case VolumeUnit::CUBIC_FEET:   return "cubic feet";
        case VolumeUnit::CUBIC_YARDS:  return "cubic yards";
    }
    return "unknown";
}

// ============================================================================
// VALUE AND UNIT SPLITTING
// ============================================================================

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) {
    // Trim whitespace
    std::string trimmed = input;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\n\r"));
    trimmed.erase(trimmed.find_last_not_of(" \t\n\r") + 1);

    if (trimmed.empty()) {
        throw UnitParseError("Empty input string");
    }

    // Find where numeric part ends
    size_t num_end = 0;
    bool found_decimal = false;
    bool found_digit = false;

    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];

        if (std::isdigit(static_cast<unsigned char>(c))) {
            found_digit = true;
            num_end = i + 1;
        } else if (c == '.' && !found_decimal) {
            found_decimal = true;
            num_end = i + 1;
        } else if ((c == '-' || c == '+') && i == 0) {
            num_end = i + 1;
        } else {
            // Start of unit suffix
            break;
        }
    }

    if (!found_digit) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }

    std::string value_str = trimmed.substr(0, num_end);
    std::string unit_str = trimmed.substr(num_end);

    unit_str.erase(0, unit_str.find_first_not_of(" \t"));
    unit_str.erase(unit_str.find_last_not_of(" \t") + 1);

    return {value_str, unit_str};
}

// ============================================================================
// PARSING
// ============================================================================

ParsedLength UnitParser::parse_length(const std::string& input,
                                      LengthUnit default_unit,
                                      LengthUnit canonical_unit) {
    auto [value_str, unit_str] = split_value_and_unit(input);

    double value;
    try {
        value = std::stod(value_str);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid numeric value: '" + value_str + "'");
    }

    LengthUnit source_unit = default_unit;
    bool had_explicit_unit = !unit_str.empty();
    if (had_explicit_unit) {
        source_unit = parse_length_unit(unit_str);
    }

    return ParsedLength(convert_length(value, source_unit, canonical_unit),
                        source_unit, had_explicit_unit);
}

double UnitParser::parse_conversion_factor(const std::string& input) {
    std::string trimmed = normalize(input);
    if (trimmed.empty()) {
        throw UnitParseError("Empty conversion factor");
    }

    size_t colon = trimmed.find(':');
    if (colon != std::string::npos) {
        LengthUnit from_unit = parse_length_unit(trimmed.substr(0, colon));
        LengthUnit to_unit = parse_length_unit(trimmed.substr(colon + 1));
        return vertical_factor(from_unit, to_unit);
    }

    size_t consumed = 0;
    double factor;
    try {
        factor = std::stod(trimmed, &consumed);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid conversion factor: '" + input + "'");
    }
    if (consumed != trimmed.size()) {
        throw UnitParseError("Invalid conversion factor: '" + input + "'");
    }
    if (!std::isfinite(factor) || factor == 0.0) {
        throw UnitParseError("Conversion factor must be finite and non-zero: '" + input + "'");
    }
    return factor;
}

} // namespace demforge

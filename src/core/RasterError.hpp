/**
 * @file RasterError.hpp
 * @brief Error taxonomy for raster operations
 *
 * Every core failure is raised as a RasterError carrying a machine-readable
 * code plus the operation, file path and underlying GDAL message so an
 * operator can act on it.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace demforge {

enum class RasterErrorCode {
    EMPTY_MOSAIC_INPUT,
    BAND_COUNT_MISMATCH,
    REPROJECTION_ERROR,
    RESAMPLE_ERROR,
    RASTER_IO_ERROR,
    CRS_MISMATCH,
    NO_OVERLAP,
    FIELD_NOT_FOUND,
    INVALID_ARGUMENT,
    CANCELLED
};

/**
 * @brief Stable name for an error code ("EmptyMosaicInput", "NoOverlap", ...)
 */
const char* error_code_name(RasterErrorCode code);

/**
 * @brief Exception thrown by all raster operations
 */
class RasterError : public std::runtime_error {
public:
    RasterError(RasterErrorCode code,
                const std::string& operation,
                const std::string& message,
                const std::string& path = "",
                const std::string& detail = "");

    RasterErrorCode code() const { return code_; }
    const std::string& operation() const { return operation_; }
    const std::string& path() const { return path_; }
    const std::string& detail() const { return detail_; }

private:
    RasterErrorCode code_;
    std::string operation_;
    std::string path_;
    std::string detail_;

    static std::string format(RasterErrorCode code, const std::string& operation,
                              const std::string& message, const std::string& path,
                              const std::string& detail);
};

/**
 * @brief Throw a RasterError whose detail is GDAL's last error message
 */
[[noreturn]] void throw_gdal_error(RasterErrorCode code,
                                   const std::string& operation,
                                   const std::string& message,
                                   const std::string& path = "");

} // namespace demforge

/**
 * @file RasterError.cpp
 * @brief Formatting of raster errors
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterError.hpp"
#include <cpl_error.h>
#include <sstream>

namespace demforge {

const char* error_code_name(RasterErrorCode code) {
    switch (code) {
        case RasterErrorCode::EMPTY_MOSAIC_INPUT:  return "EmptyMosaicInput";
        case RasterErrorCode::BAND_COUNT_MISMATCH: return "BandCountMismatch";
        case RasterErrorCode::REPROJECTION_ERROR:  return "ReprojectionError";
        case RasterErrorCode::RESAMPLE_ERROR:      return "ResampleError";
        case RasterErrorCode::RASTER_IO_ERROR:     return "RasterIOError";
        case RasterErrorCode::CRS_MISMATCH:        return "CrsMismatch";
        case RasterErrorCode::NO_OVERLAP:          return "NoOverlap";
        case RasterErrorCode::FIELD_NOT_FOUND:     return "FieldNotFound";
        case RasterErrorCode::INVALID_ARGUMENT:    return "InvalidArgument";
        case RasterErrorCode::CANCELLED:           return "Cancelled";
    }
    return "Unknown";
}

RasterError::RasterError(RasterErrorCode code,
                         const std::string& operation,
                         const std::string& message,
                         const std::string& path,
                         const std::string& detail)
    : std::runtime_error(format(code, operation, message, path, detail)),
      code_(code), operation_(operation), path_(path), detail_(detail) {}

std::string RasterError::format(RasterErrorCode code, const std::string& operation,
                                const std::string& message, const std::string& path,
                                const std::string& detail) {
    std::ostringstream oss;
    oss << error_code_name(code) << " in " << operation << ": " << message;
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    if (!detail.empty()) {
        oss << " (" << detail << ")";
    }
    return oss.str();
}

void throw_gdal_error(RasterErrorCode code,
                      const std::string& operation,
                      const std::string& message,
                      const std::string& path) {
    const char* gdal_msg = CPLGetLastErrorMsg();
    std::string detail = (gdal_msg && *gdal_msg) ? gdal_msg : "";
    CPLErrorReset();
    throw RasterError(code, operation, message, path, detail);
}

} // namespace demforge

/**
 * @file GdalUtils.cpp
 * @brief Shared GDAL/OGR helpers
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GdalUtils.hpp"
#include "CancellationToken.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace demforge {

namespace {

void CPL_STDCALL gdal_log_handler(CPLErr error_class, CPLErrorNum error_num, const char* message) {
    static Logger logger("GDAL");
    std::string text = "[" + std::to_string(error_num) + "] " + (message ? message : "");

    switch (error_class) {
        case CE_Fatal:
        case CE_Failure:
            logger.error(text);
            break;
        case CE_Warning:
            logger.warning(text);
            break;
        case CE_Debug:
            logger.trace(text);
            break;
        default:
            logger.debug(text);
            break;
    }
}

} // namespace

void ensure_gdal_registered() {
    static std::once_flag registered;
    std::call_once(registered, []() { GDALAllRegister(); });
}

void install_gdal_log_handler() {
    CPLSetErrorHandler(gdal_log_handler);
}

GDALDatasetPtr open_raster(const std::string& path, bool update, const std::string& operation) {
    ensure_gdal_registered();

    unsigned int flags = GDAL_OF_RASTER | GDAL_OF_VERBOSE_ERROR;
    flags |= update ? GDAL_OF_UPDATE : GDAL_OF_READONLY;

    GDALDatasetPtr dataset(GDALDataset::Open(path.c_str(), flags, nullptr, nullptr, nullptr));
    if (!dataset) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, operation,
                         update ? "cannot open raster for update" : "cannot open raster", path);
    }
    return dataset;
}

GDALDatasetPtr open_csv_table(const std::string& path, const std::string& operation) {
    ensure_gdal_registered();

    // The CSV driver only claims .csv files unless the name carries its prefix
    std::string name = path;
    if (!EQUAL(std::filesystem::path(path).extension().string().c_str(), ".csv")) {
        name = "CSV:" + path;
    }

    const char* const allowed_drivers[] = {"CSV", nullptr};
    const char* const open_options[] = {"HEADERS=YES", nullptr};
    GDALDatasetPtr dataset(GDALDataset::Open(name.c_str(),
                                             GDAL_OF_VECTOR | GDAL_OF_VERBOSE_ERROR,
                                             allowed_drivers, open_options, nullptr));
    if (!dataset) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, operation, "cannot open table", path);
    }
    return dataset;
}

GDALDatasetPtr create_csv_table(const std::string& path, const std::string& operation) {
    ensure_gdal_registered();

    std::error_code ec;
    std::filesystem::path table_path(path);
    if (table_path.has_parent_path()) {
        std::filesystem::create_directories(table_path.parent_path(), ec);
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("CSV");
    if (!driver) {
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, operation,
                          "CSV driver not available", path);
    }

    // The CSV driver refuses to create over an existing file
    VSIStatBufL stat_buffer;
    if (VSIStatL(path.c_str(), &stat_buffer) == 0 && VSIUnlink(path.c_str()) != 0) {
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, operation,
                          "cannot replace existing file", path);
    }

    GDALDatasetPtr dataset(driver->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, operation, "cannot create table", path);
    }
    return dataset;
}

OGRSpatialReference make_spatial_reference(const std::string& definition,
                                           const std::string& operation) {
    OGRSpatialReference srs;
    if (definition.empty() || srs.SetFromUserInput(definition.c_str()) != OGRERR_NONE) {
        throw_gdal_error(RasterErrorCode::REPROJECTION_ERROR, operation,
                         "invalid coordinate reference system '" + definition + "'");
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

std::string to_wkt(const OGRSpatialReference& srs) {
    char* wkt = nullptr;
    if (srs.exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        return "";
    }
    std::string result = wkt ? wkt : "";
    CPLFree(wkt);
    return result;
}

int CPL_STDCALL cancellation_progress(double, const char*, void* token) {
    const auto* cancel = static_cast<const CancellationToken*>(token);
    return (cancel && cancel->is_cancelled()) ? FALSE : TRUE;
}

void throw_if_cancelled(const CancellationToken* cancel, const std::string& operation) {
    if (cancel && cancel->is_cancelled()) {
        throw RasterError(RasterErrorCode::CANCELLED, operation, "operation cancelled");
    }
}

std::string resample_to_string(ResampleAlgorithm algorithm) {
    switch (algorithm) {
        case ResampleAlgorithm::NEAREST:      return "near";
        case ResampleAlgorithm::BILINEAR:     return "bilinear";
        case ResampleAlgorithm::CUBIC:        return "cubic";
        case ResampleAlgorithm::CUBIC_SPLINE: return "cubicspline";
        case ResampleAlgorithm::LANCZOS:      return "lanczos";
        case ResampleAlgorithm::AVERAGE:      return "average";
    }
    return "bilinear";
}

ResampleAlgorithm parse_resample(const std::string& name) {
    if (name == "near" || name == "nearest") return ResampleAlgorithm::NEAREST;
    if (name == "bilinear") return ResampleAlgorithm::BILINEAR;
    if (name == "cubic") return ResampleAlgorithm::CUBIC;
    if (name == "cubicspline" || name == "cubic-spline") return ResampleAlgorithm::CUBIC_SPLINE;
    if (name == "lanczos") return ResampleAlgorithm::LANCZOS;
    if (name == "average") return ResampleAlgorithm::AVERAGE;
    throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "parse_resample",
                      "unknown resampling algorithm '" + name +
                      "' (use near, bilinear, cubic, cubicspline, lanczos or average)");
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

} // namespace demforge

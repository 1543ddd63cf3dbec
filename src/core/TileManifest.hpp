/**
 * @file TileManifest.hpp
 * @brief CSV manifest of downloaded elevation tiles
 *
 * Columns: workunit, project, ql, dem_gsd_meters, url, local_path,
 * metadata_link, status. Only local_path and dem_gsd_meters are required
 * when reading. The table is read and written through OGR's CSV driver.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "BatchReport.hpp"
#include "FieldSchema.hpp"
#include <optional>
#include <string>
#include <vector>

namespace demforge {

struct ManifestEntry {
    std::string workunit;
    std::string project;
    std::string quality_level;
    std::optional<double> dem_gsd_meters;
    std::string url;
    std::string local_path;
    std::string metadata_link;
    std::string status;
};

class TileManifest {
public:
    /**
     * @brief Schema of the manifest table
     */
    static FieldSchema schema();

    /**
     * @brief Read a manifest; one report entry per data row
     *
     * Rows marked status=error, rows without a local path and rows with a
     * malformed GSD are reported as failures. Relative local paths that do
     * not exist from the working directory are resolved against the
     * manifest's own directory.
     * @throws RasterError RasterIOError (file unreadable), FieldNotFound (missing column)
     */
    static BatchReport<ManifestEntry> read(const std::string& path);

    /**
     * @brief Write entries, replacing any existing file
     * @throws RasterError (RasterIOError) when the file cannot be written
     */
    static void write(const std::string& path, const std::vector<ManifestEntry>& entries);
};

} // namespace demforge

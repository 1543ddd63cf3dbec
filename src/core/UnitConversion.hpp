/**
 * @file UnitConversion.hpp
 * @brief In-place scaling of raster values
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <cstdint>

namespace demforge {

struct ConversionStats {
    size_t windows = 0;
    size_t buffer_cells = 0;        // Largest window read at once
    uint64_t converted_cells = 0;
    uint64_t nodata_cells = 0;
};

/**
 * @brief Multiplies every valid cell of a band by a factor, window by window
 *
 * Nodata and NaN cells are left as they are. A failure part-way leaves the
 * windows already written converted; nothing is rolled back.
 */
class UnitConversion {
public:
    explicit UnitConversion(const ConversionConfig& config);

    /**
     * @throws RasterError RasterIOError, InvalidArgument (bad band, window or factor), Cancelled
     */
    ConversionStats run(const CancellationToken* cancel = nullptr) const;

private:
    ConversionConfig config_;
};

} // namespace demforge

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/logstore.h>

namespace dotgrid
{

auto inline canvasLog = logstore::category("dotgrid.canvas",
                                           "Logs canvas construction, resizing and access violations.",
                                           logstore::category::state::Disabled,
                                           logstore::category::visibility::Hidden);

auto inline rasterLog = logstore::category("dotgrid.raster",
                                           "Logs rasterizer parameter validation and tracing.",
                                           logstore::category::state::Disabled,
                                           logstore::category::visibility::Hidden);

auto inline mapperLog = logstore::category("dotgrid.mapper",
                                           "Logs pixel buffer mapping and color application.",
                                           logstore::category::state::Disabled,
                                           logstore::category::visibility::Hidden);

auto inline densityLog = logstore::category("dotgrid.density",
                                            "Logs density set construction and rendering.",
                                            logstore::category::state::Disabled,
                                            logstore::category::visibility::Hidden);

} // namespace dotgrid

#if defined(DOTGRID_LOG_TRACE)
    #define DOTGRID_TRACE(category, ...) \
        do                               \
        {                                \
            if (category)                \
                category()(__VA_ARGS__); \
        } while (0)
#else
    #define DOTGRID_TRACE(category, ...) \
        do                               \
        {                                \
        } while (0)
#endif

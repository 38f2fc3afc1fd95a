#pragma once

// Logging goes through spdlog. Header-only usage is forced locally without exporting
// SPDLOG_HEADER_ONLY as a public compile definition (avoids redefinition warnings if
// consumers link the compiled spdlog variant).
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace sendpath {

namespace log = spdlog;

}  // namespace sendpath

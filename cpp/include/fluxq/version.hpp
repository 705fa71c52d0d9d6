#pragma once

#ifndef FLUXQ_VERSION_STRING
#define FLUXQ_VERSION_STRING "0.1.0"
#endif

namespace fluxq {

inline const char* version() noexcept { return FLUXQ_VERSION_STRING; }

} // namespace fluxq

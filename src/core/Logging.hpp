#pragma once

#include <QString>

namespace bdf {

/// Sets the Boost.Log severity threshold from a config string
/// (trace, debug, info, warning, error). Unknown values fall back to info.
/// Returns false if the value was not recognised.
bool initLogging(const QString& level);

} // namespace bdf

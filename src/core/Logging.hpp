#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace rbridge {

namespace Logging {

/// Maps "trace" .. "fatal" (case-insensitive, "warn" accepted) to a Boost.Log
/// severity. Unknown names yield fallback.
boost::log::trivial::severity_level parseLevel(const QString& name,
                                               boost::log::trivial::severity_level fallback = boost::log::trivial::info);

/// Installs the global severity filter and, when filePath is non-empty, an
/// auto-flushed file sink appending to it. Console output is left to the
/// Boost.Log default sink. Safe to call again to change the level.
void init(const QString& level, const QString& filePath = QString());

} // namespace Logging

} // namespace rbridge

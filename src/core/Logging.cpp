#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace bdf {

bool initLogging(const QString& level)
{
    namespace logging = boost::log;
    using logging::trivial::severity_level;

    const QString key = level.trimmed().toLower();
    severity_level threshold = severity_level::info;
    bool known = true;
    if (key == QLatin1String("trace")) threshold = severity_level::trace;
    else if (key == QLatin1String("debug")) threshold = severity_level::debug;
    else if (key == QLatin1String("info")) threshold = severity_level::info;
    else if (key == QLatin1String("warning")) threshold = severity_level::warning;
    else if (key == QLatin1String("error")) threshold = severity_level::error;
    else known = false;

    logging::core::get()->set_filter(logging::trivial::severity >= threshold);

    if (!known)
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level '" << level.toStdString() << "', using info";
    return known;
}

} // namespace bdf

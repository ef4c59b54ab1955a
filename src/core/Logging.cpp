#include "Logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace rbridge {

namespace Logging {

namespace logging = boost::log;
namespace expr = boost::log::expressions;

boost::log::trivial::severity_level parseLevel(const QString& name,
                                               boost::log::trivial::severity_level fallback)
{
    const QString n = name.trimmed().toLower();
    if (n == "trace") return logging::trivial::trace;
    if (n == "debug") return logging::trivial::debug;
    if (n == "info") return logging::trivial::info;
    if (n == "warning" || n == "warn") return logging::trivial::warning;
    if (n == "error") return logging::trivial::error;
    if (n == "fatal") return logging::trivial::fatal;
    return fallback;
}

void init(const QString& level, const QString& filePath)
{
    static bool sinksInstalled = false;

    const auto severity = parseLevel(level);
    logging::core::get()->set_filter(logging::trivial::severity >= severity);

    if (sinksInstalled)
        return;
    sinksInstalled = true;

    logging::add_common_attributes();

    // Once any sink is registered the default console sink goes away, so
    // console output needs its own sink alongside the file.
    if (filePath.isEmpty())
        return;

    const auto format = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
        << " [" << logging::trivial::severity << "] " << expr::smessage;

    logging::add_console_log(std::clog, logging::keywords::format = format);

    QDir().mkpath(QFileInfo(filePath).absolutePath());
    logging::add_file_log(
        logging::keywords::file_name = filePath.toStdString(),
        logging::keywords::open_mode = std::ios_base::app,
        logging::keywords::auto_flush = true,
        logging::keywords::format = format);

    BOOST_LOG_TRIVIAL(info) << "[Logging] Writing log to " << filePath.toStdString();
}

} // namespace Logging

} // namespace rbridge

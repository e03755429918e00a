#include "logging.hpp"

#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace pharmiq {

void init_logging(plog::Severity max_severity) {
    static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender;
    if (auto* logger = plog::get()) {
        logger->setMaxSeverity(max_severity);
        return;
    }
    plog::init(max_severity, &console_appender);
    PLOGD << "Logging initialized";
}

}

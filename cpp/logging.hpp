#pragma once

#include <plog/Severity.h>

namespace pharmiq {

// Routes library log output to a colored console appender. Safe to call more than once;
// later calls only change the maximum severity.
void init_logging(plog::Severity max_severity = plog::info);

}

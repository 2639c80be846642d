#pragma once

#include <QLoggingCategory>

namespace oscal {

// Internal faults only (a built-in pattern that does not compile). Rejected
// values are returned as errors, not logged.
Q_DECLARE_LOGGING_CATEGORY(oscalTypesLog)

} // namespace oscal

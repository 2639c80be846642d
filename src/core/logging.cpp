#include "core/logging.hpp"

namespace oscal {

Q_LOGGING_CATEGORY(oscalTypesLog, "oscal.types", QtWarningMsg)

} // namespace oscal

#include "core/options.hpp"

#include <QtGlobal>

namespace oscal {

ParseOptions ParseOptions::from_environment() {
    ParseOptions options;
    if (!qEnvironmentVariableIsSet("OSCAL_DATE_VALIDATION")) {
        return options;
    }

    bool ok = false;
    const int value = qEnvironmentVariableIntValue("OSCAL_DATE_VALIDATION", &ok);
    if (ok) {
        options.date_validation = value != 0;
    }
    return options;
}

} // namespace oscal

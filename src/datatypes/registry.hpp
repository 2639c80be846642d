#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <string_view>
#include <vector>

namespace oscal {

/**
 * Look up a datatype by its metaschema name ("DateDatatype", "URIDatatype", ...).
 * Unknown names fail with ErrorKind::UnrecognizedType.
 */
[[nodiscard]] Result<DatatypeInfo> find_datatype(std::string_view name);

/**
 * Every registered datatype, in a stable order.
 */
[[nodiscard]] std::vector<DatatypeInfo> all_datatypes();

/**
 * Parse text as the named datatype and discard the value.
 *
 * Used by schema-driven callers that only know a field's datatype by name.
 */
[[nodiscard]] Result<void> validate_value(std::string_view name, std::string_view text,
                                          const ParseOptions& options = {});

} // namespace oscal

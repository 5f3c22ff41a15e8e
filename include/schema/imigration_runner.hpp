#pragma once

#include "core/error.hpp"
#include <string>

namespace pgtenant {

class SchemaContext;

/**
 * @brief Applies schema migrations inside one tenant schema
 *
 * Treated as a black box by SchemaLifecycle. Implementations may switch the
 * context's search path and are not required to restore it; the caller
 * resets to public afterwards.
 */
class IMigrationRunner {
public:
    virtual ~IMigrationRunner() = default;

    /**
     * @brief Bring a schema up to date
     * @param context Context of the connection to run on
     * @param schema_name Target schema (already created)
     * @param verbosity 0 = quiet, 1 = one line per applied migration, 2 = also skipped ones
     */
    [[nodiscard]] virtual Status apply(SchemaContext& context, const std::string& schema_name,
                                       int verbosity) = 0;
};

} // namespace pgtenant

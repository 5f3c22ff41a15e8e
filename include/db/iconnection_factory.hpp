#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace pgtenant {

/**
 * @brief Opens sessions for a pool; tests substitute in-memory fakes
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @return Connected session, or nullptr after logging why it failed
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(const std::string& connection_string) = 0;
};

} // namespace pgtenant

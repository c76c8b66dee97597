/**
 * @file errors.hpp
 * @brief Exception types raised across the engine
 *
 * Only two conditions are fatal to a run: a table whose header cannot be
 * mapped onto the required identity columns, and a persistence failure
 * that survived its retry budget. Everything else degrades to a logged
 * diagnostic or a status-bearing metric result.
 */

#ifndef FUNDMETRICS_CORE_ERRORS_HPP
#define FUNDMETRICS_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace fundmetrics {
namespace core {

/**
 * @class SchemaError
 * @brief Header rows cannot be mapped onto the required layout
 *
 * Raised before any write so that no partial schema is ever committed.
 */
class SchemaError : public std::runtime_error {
public:
    SchemaError(const std::string& missing_column, const std::string& message)
        : std::runtime_error(message), missing_column_(missing_column) {}

    /// Name of the required column (or requirement) that was not found
    const std::string& missing_column() const noexcept { return missing_column_; }

private:
    std::string missing_column_;
};

/**
 * @class PersistenceConflict
 * @brief A write met a key state it did not expect
 *
 * Retryable: an insert hit an existing key or an update hit a missing one,
 * usually because another run touched the same portfolio in between.
 */
class PersistenceConflict : public std::runtime_error {
public:
    explicit PersistenceConflict(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class PersistenceError
 * @brief Persistence failed after the retry budget was spent
 */
class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& portfolio_id, const std::string& message)
        : std::runtime_error(message), portfolio_id_(portfolio_id) {}

    const std::string& portfolio_id() const noexcept { return portfolio_id_; }

private:
    std::string portfolio_id_;
};

} // namespace core
} // namespace fundmetrics

#endif // FUNDMETRICS_CORE_ERRORS_HPP

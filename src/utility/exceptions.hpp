#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace geoedit {

class TransactionRecord;

/**
 * Base exception class for all geoedit errors
 */
class GeoEditException : public std::runtime_error {
  public:
    explicit GeoEditException(const std::string &message)
        : std::runtime_error(message) {}

    /**
     * @brief Whether the caller may retry after re-validating its inputs.
     */
    virtual bool is_retryable() const noexcept { return false; }
};

/**
 * Base for errors that reject a submitted operation. The rejected
 * transaction record is attached when the engine created one.
 */
class OperationRejected : public GeoEditException {
  public:
    OperationRejected(const std::string &message,
                      std::shared_ptr<const TransactionRecord> record)
        : GeoEditException(message), m_record(std::move(record)) {}

    /**
     * @brief The record in state Rejected, or null if rejection happened
     * before a record existed.
     */
    const std::shared_ptr<const TransactionRecord> &record() const noexcept {
        return m_record;
    }

    void attach(std::shared_ptr<const TransactionRecord> record) {
        m_record = std::move(record);
    }

  private:
    std::shared_ptr<const TransactionRecord> m_record;
};

/**
 * Descriptor with no directives was submitted
 */
class EmptyOperationError : public OperationRejected {
  public:
    explicit EmptyOperationError(
        const std::string &message,
        std::shared_ptr<const TransactionRecord> record = nullptr)
        : OperationRejected("Empty operation: " + message, std::move(record)) {
    }
};

/**
 * Directive references a collection, feature or handle that does not exist
 */
class ValidationError : public OperationRejected {
  public:
    explicit ValidationError(
        const std::string &message,
        std::shared_ptr<const TransactionRecord> record = nullptr)
        : OperationRejected("Validation error: " + message,
                            std::move(record)) {}
};

/**
 * Store state drifted between validation and commit
 */
class ConcurrentModificationError : public OperationRejected {
  public:
    explicit ConcurrentModificationError(
        const std::string &message,
        std::shared_ptr<const TransactionRecord> record = nullptr)
        : OperationRejected("Concurrent modification: " + message,
                            std::move(record)) {}

    bool is_retryable() const noexcept override { return true; }
};

/**
 * Geometry kernel reported a failure while applying a directive
 */
class ApplyError : public OperationRejected {
  public:
    explicit ApplyError(
        const std::string &message,
        std::shared_ptr<const TransactionRecord> record = nullptr)
        : OperationRejected("Apply error: " + message, std::move(record)) {}

    bool is_retryable() const noexcept override { return true; }
};

/**
 * Chained operation requested from a parent that is not applied
 */
class NoParentTransactionError : public OperationRejected {
  public:
    explicit NoParentTransactionError(
        const std::string &message,
        std::shared_ptr<const TransactionRecord> record = nullptr)
        : OperationRejected("No parent transaction: " + message,
                            std::move(record)) {}
};

/**
 * Submission cancelled before the mutation context accepted it
 */
class CancelledError : public OperationRejected {
  public:
    explicit CancelledError(const std::string &message)
        : OperationRejected("Cancelled: " + message, nullptr) {}
};

/**
 * Store mutation attempted off the mutation context. Programming defect in
 * the caller.
 */
class WrongContextError : public GeoEditException {
  public:
    explicit WrongContextError(const std::string &message)
        : GeoEditException("Wrong context: " + message) {}
};

/**
 * Read of a feature or collection that does not exist
 */
class NotFoundError : public GeoEditException {
  public:
    explicit NotFoundError(const std::string &message)
        : GeoEditException("Not found: " + message) {}
};

/**
 * Geometry kernel failure (degenerate result, unsupported input)
 */
class GeometryError : public GeoEditException {
  public:
    explicit GeometryError(const std::string &message)
        : GeoEditException("Geometry error: " + message) {}
};

/**
 * Exception for I/O operations (file read/write, JSON parsing)
 */
class IOError : public GeoEditException {
  public:
    explicit IOError(const std::string &message)
        : GeoEditException("I/O error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public GeoEditException {
  public:
    explicit ConfigError(const std::string &message)
        : GeoEditException("Configuration error: " + message) {}
};

} // namespace geoedit

/**
 * @file SnmpErrors.hpp
 * @brief Exception types raised by the protocol engine.
 *
 * Every failure of a round trip is reported as one of these. Callers can catch
 * SnmpError for all of them or the concrete type to tell a dead agent
 * (TransportError) from a misbehaving one (DecodeError, ValidationError).
 */

#pragma once

#include "core/types/ObjectIdentifier.hpp"
#include "core/types/SnmpValue.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace snmpwire::core {

/**
 * @brief Base class of all protocol engine errors.
 */
class SnmpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief I/O failure, timeout, or an oversized reply.
 */
class TransportError : public SnmpError {
public:
    using SnmpError::SnmpError;
};

/**
 * @brief Request could not be encoded (e.g. unknown operation kind).
 */
class EncodeError : public SnmpError {
public:
    using SnmpError::SnmpError;
};

/**
 * @brief Reply bytes could not be parsed.
 */
class DecodeError : public SnmpError {
public:
    using SnmpError::SnmpError;
};

/**
 * @brief A binding value does not have the shape its consumer expected.
 */
class TypeMismatchError : public DecodeError {
public:
    TypeMismatchError(TagClass observedClass, uint32_t observedTag, std::string expectedType);

    [[nodiscard]] TagClass observedClass() const { return observedClass_; }
    [[nodiscard]] uint32_t observedTag() const { return observedTag_; }
    [[nodiscard]] const std::string& expectedType() const { return expectedType_; }

private:
    TagClass observedClass_;
    uint32_t observedTag_;
    std::string expectedType_;
};

/**
 * @brief Classification of a protocol-invalid reply.
 */
enum class ValidationFailure {
    IdMismatch,
    ServerError,
    NoBindings,
    MissingBindings,
    ExtraneousBindings,
    NoSuchObject,
    NoSuchInstance,
    EndOfMibView,
    UnexpectedNull,
    MissingPrefix,
    NonIncreasing
};

/**
 * @brief Returns a short name for @p failure, e.g. "id mismatch".
 */
std::string validationFailureToString(ValidationFailure failure);

/**
 * @brief Well-formed reply that breaks RFC 3416 rules or does not answer the
 *        request.
 *
 * what() always starts with "invalid response: ".
 */
class ValidationError : public SnmpError {
public:
    ValidationError(ValidationFailure failure, const std::string& detail);

    [[nodiscard]] ValidationFailure failure() const { return failure_; }

    /// Error-status from the reply, set for ServerError.
    [[nodiscard]] std::optional<int> errorStatus() const { return errorStatus_; }

    /// Error-index from the reply, set for ServerError when it is in range.
    [[nodiscard]] std::optional<int> errorIndex() const { return errorIndex_; }

    /// Identifier of the offending binding, when one is known.
    [[nodiscard]] const std::optional<ObjectIdentifier>& binding() const { return binding_; }

    ValidationError& withErrorStatus(int status);
    ValidationError& withErrorIndex(int index);
    ValidationError& withBinding(const ObjectIdentifier& name);

private:
    ValidationFailure failure_;
    std::optional<int> errorStatus_;
    std::optional<int> errorIndex_;
    std::optional<ObjectIdentifier> binding_;
};

} // namespace snmpwire::core

#include "core/types/SnmpErrors.hpp"

#include <utility>

namespace snmpwire::core {

namespace {

std::string tagClassName(TagClass tagClass) {
    switch (tagClass) {
        case TagClass::Universal: return "universal";
        case TagClass::Application: return "application";
        case TagClass::ContextSpecific: return "context";
        case TagClass::Private: return "private";
    }
    return "unknown";
}

} // anonymous namespace

TypeMismatchError::TypeMismatchError(TagClass observedClass, uint32_t observedTag,
                                     std::string expectedType)
    : DecodeError("type mismatch: {class:" + tagClassName(observedClass) +
                  " tag:" + std::to_string(observedTag) + "} vs. " + expectedType),
      observedClass_(observedClass),
      observedTag_(observedTag),
      expectedType_(std::move(expectedType)) {}

std::string validationFailureToString(ValidationFailure failure) {
    switch (failure) {
        case ValidationFailure::IdMismatch: return "id mismatch";
        case ValidationFailure::ServerError: return "server error";
        case ValidationFailure::NoBindings: return "no bindings";
        case ValidationFailure::MissingBindings: return "missing bindings";
        case ValidationFailure::ExtraneousBindings: return "extraneous bindings";
        case ValidationFailure::NoSuchObject: return "no such object";
        case ValidationFailure::NoSuchInstance: return "no such instance";
        case ValidationFailure::EndOfMibView: return "end of mib view";
        case ValidationFailure::UnexpectedNull: return "unexpected null";
        case ValidationFailure::MissingPrefix: return "missing [1 3] prefix";
        case ValidationFailure::NonIncreasing: return "non-increasing name";
    }
    return "unknown";
}

ValidationError::ValidationError(ValidationFailure failure, const std::string& detail)
    : SnmpError("invalid response: " + detail), failure_(failure) {}

ValidationError& ValidationError::withErrorStatus(int status) {
    errorStatus_ = status;
    return *this;
}

ValidationError& ValidationError::withErrorIndex(int index) {
    errorIndex_ = index;
    return *this;
}

ValidationError& ValidationError::withBinding(const ObjectIdentifier& name) {
    binding_ = name;
    return *this;
}

} // namespace snmpwire::core

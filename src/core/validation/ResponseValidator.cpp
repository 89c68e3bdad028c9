#include "core/validation/ResponseValidator.hpp"

#include "core/types/ErrorStatus.hpp"
#include "core/types/SnmpErrors.hpp"

namespace snmpwire::core {

namespace {

const ObjectIdentifier kIsoOrg{1, 3};

void checkBindingValue(const Binding& binding) {
    ValidationFailure failure;
    if (std::holds_alternative<NoSuchObject>(binding.value)) {
        failure = ValidationFailure::NoSuchObject;
    } else if (std::holds_alternative<NoSuchInstance>(binding.value)) {
        failure = ValidationFailure::NoSuchInstance;
    } else if (std::holds_alternative<EndOfMibView>(binding.value)) {
        failure = ValidationFailure::EndOfMibView;
    } else if (std::holds_alternative<Null>(binding.value)) {
        failure = ValidationFailure::UnexpectedNull;
    } else {
        return;
    }

    throw ValidationError(failure,
                          binding.name.toString() + ": " + validationFailureToString(failure))
        .withBinding(binding.name);
}

} // anonymous namespace

void checkResponse(const Response& response, const Request& request) {
    if (response.id != request.id) {
        throw ValidationError(ValidationFailure::IdMismatch,
                              "id mismatch (sent " + std::to_string(request.id) + ", got " +
                                  std::to_string(response.id) + ")");
    }

    if (response.errorStatus != ErrorStatus::NoError) {
        const int index = response.errorIndex;
        std::string detail = "server error: " + ErrorStatus(response.errorStatus).toString();

        if (index >= 0 && static_cast<size_t>(index) < response.bindings.size() &&
            static_cast<size_t>(index) < request.bindings.size()) {
            const auto& culprit = request.bindings[static_cast<size_t>(index)];
            throw ValidationError(ValidationFailure::ServerError,
                                  "binding " + culprit.name.toString() + ": " + detail)
                .withErrorStatus(response.errorStatus)
                .withErrorIndex(index)
                .withBinding(culprit.name);
        }
        throw ValidationError(ValidationFailure::ServerError, detail)
            .withErrorStatus(response.errorStatus);
    }

    const size_t count = response.bindings.size();
    if (count == 0) {
        throw ValidationError(ValidationFailure::NoBindings, "no bindings");
    }
    if (count < request.bindings.size()) {
        throw ValidationError(ValidationFailure::MissingBindings,
                              "missing bindings (expected " +
                                  std::to_string(request.bindings.size()) + ", got " +
                                  std::to_string(count) + ")");
    }
    if (count > request.bindings.size() && request.kind != OperationKind::GetBulk) {
        throw ValidationError(ValidationFailure::ExtraneousBindings,
                              "extraneous bindings (expected " +
                                  std::to_string(request.bindings.size()) + ", got " +
                                  std::to_string(count) + ")");
    }

    for (const auto& binding : response.bindings) {
        checkBindingValue(binding);
        if (!hasPrefix(binding.name, kIsoOrg)) {
            throw ValidationError(ValidationFailure::MissingPrefix,
                                  binding.name.toString() + ": missing [1 3] prefix")
                .withBinding(binding.name);
        }
    }
}

} // namespace snmpwire::core

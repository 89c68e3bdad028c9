#include "core/types/ErrorStatus.hpp"

#include <array>

namespace snmpwire::core {

namespace {
constexpr std::array<const char*, 19> kErrorText = {
    "no error",
    "too big",
    "no such name",
    "bad value",
    "read only",
    "gen err",
    "no access",
    "wrong type",
    "wrong length",
    "wrong encoding",
    "wrong value",
    "no creation",
    "inconsistent value",
    "resource unavailable",
    "commit failed",
    "undo failed",
    "authorization error",
    "not writable",
    "inconsistent name",
};
} // anonymous namespace

std::string ErrorStatus::toString() const {
    if (code_ >= 0 && static_cast<size_t>(code_) < kErrorText.size()) {
        return kErrorText[static_cast<size_t>(code_)];
    }
    return "code " + std::to_string(code_);
}

} // namespace snmpwire::core

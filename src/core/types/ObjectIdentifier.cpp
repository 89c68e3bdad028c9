#include "core/types/ObjectIdentifier.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace snmpwire::core {

ObjectIdentifier ObjectIdentifier::fromString(const std::string& text) {
    std::string_view view(text);
    if (!view.empty() && view.front() == '.') {
        view.remove_prefix(1);
    }
    if (view.empty()) {
        throw std::invalid_argument("Empty object identifier");
    }

    std::vector<uint32_t> components;
    uint64_t current = 0;
    bool haveDigit = false;

    for (char c : view) {
        if (c == '.') {
            if (!haveDigit) {
                throw std::invalid_argument("Empty component in object identifier: " + text);
            }
            components.push_back(static_cast<uint32_t>(current));
            current = 0;
            haveDigit = false;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid character in object identifier: " + text);
        }
        current = current * 10 + static_cast<uint64_t>(c - '0');
        if (current > std::numeric_limits<uint32_t>::max()) {
            throw std::invalid_argument("Sub-identifier out of range: " + text);
        }
        haveDigit = true;
    }

    if (!haveDigit) {
        throw std::invalid_argument("Trailing dot in object identifier: " + text);
    }
    components.push_back(static_cast<uint32_t>(current));

    return ObjectIdentifier(std::move(components));
}

std::string ObjectIdentifier::toString() const {
    std::ostringstream oss;
    for (size_t i = 0; i < components_.size(); ++i) {
        if (i > 0) oss << ".";
        oss << components_[i];
    }
    return oss.str();
}

ObjectIdentifier ObjectIdentifier::child(uint32_t component) const {
    auto extended = components_;
    extended.push_back(component);
    return ObjectIdentifier(std::move(extended));
}

} // namespace snmpwire::core

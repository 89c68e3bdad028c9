#include "core/types/Binding.hpp"

#include <algorithm>

namespace snmpwire::core {

std::string Binding::toString() const {
    return name.toString() + " = " + snmpDataTypeToString(dataTypeOf(value)) + ": " +
           valueToString(value);
}

bool bindingLess(const Binding& a, const Binding& b) {
    const auto& x = a.name.components();
    const auto& y = b.name.components();
    const size_t common = std::min(x.size(), y.size());

    for (size_t i = 0; i < common; ++i) {
        if (x[i] < y[i]) {
            return true;
        }
        if (x[i] > y[i]) {
            return false;
        }
    }

    // Same leading components: a strict prefix sorts before its extension.
    return x.size() < y.size();
}

bool hasPrefix(const ObjectIdentifier& instance, const ObjectIdentifier& prefix) {
    if (instance.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.components().begin(), prefix.components().end(),
                      instance.components().begin());
}

std::vector<Binding> makeRequestBindings(const std::vector<ObjectIdentifier>& names) {
    std::vector<Binding> bindings;
    bindings.reserve(names.size());
    for (const auto& name : names) {
        bindings.push_back(Binding{name, Null{}});
    }
    return bindings;
}

} // namespace snmpwire::core

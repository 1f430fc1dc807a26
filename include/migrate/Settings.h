#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pullup::migrate {

    // Body given to synthesized non-void stubs.
    enum class StubPolicy {
        ThrowNotImplemented,
        ReturnDefault
    };

    const char *to_string(StubPolicy p);

    struct Settings {
        StubPolicy stubPolicy{StubPolicy::ThrowNotImplemented};
        std::string notImplementedType{"UnsupportedOperationException"};
        bool crossModuleDetection{true};
        // Methods every class inherits from the universal top type, as "name(T1,T2)".
        std::vector<std::string> topLevelMethods{"toString()", "equals(Object)", "hashCode()"};

        bool declaredByTop(const std::string &name, std::size_t arity) const;
    };

} // namespace pullup::migrate

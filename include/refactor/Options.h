#pragma once

#include <string>
#include <vector>
#include "migrate/Settings.h"

namespace pullup::refactor {

    struct Options {
        migrate::StubPolicy stubPolicy{migrate::StubPolicy::ThrowNotImplemented};
        bool crossModuleDetection{true};
        bool trace{false};            // write before/after/trace logs under logPath
        std::string logPath{"."};
        bool metrics{false};          // collect phase timings and counters
        std::string notImplementedType{"UnsupportedOperationException"};
        std::vector<std::string> topLevelMethods{"toString()", "equals(Object)", "hashCode()"};

        // Throws ConfigError on an unusable combination.
        void validate() const;
        migrate::Settings settings() const;

        // Options with trace enabled by PULLUP_TRACE when set to 1/true/yes.
        static Options fromEnvironment(Options base = defaults());
        static bool use_env_trace();

    private:
        static Options defaults();
    };

    inline Options Options::defaults() { return {}; }

} // namespace pullup::refactor

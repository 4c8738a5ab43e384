#pragma once

#include <iostream>
#include "domain/DiagnosticsSink.hpp"

namespace symbolgate::infrastructure {

/**
 * @class ConsoleDiagnostics
 * @brief Writes tracked exceptions to stderr.
 */
class ConsoleDiagnostics : public domain::DiagnosticsSink {
public:
    void trackException(const std::exception& e, const std::string& context) override {
        std::cerr << "[Diagnostics] " << context << ": " << e.what() << std::endl;
    }
};

} // namespace symbolgate::infrastructure

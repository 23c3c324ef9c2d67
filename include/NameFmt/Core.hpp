// =================================================================
// include/NameFmt/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "NameFmt/CliParser.hpp"
#include <iostream>

namespace NameFmt {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param out Stream receiving the rename report.
     */
    explicit Core(const Commands& commands, std::ostream& out = std::cout);

    /**
     * @brief Loads the configuration and runs the rename pass.
     * @return 0 on success, 1 on any fatal error.
     */
    int run();

private:
    void setupLogging();

    const Commands& m_commands;
    std::ostream& m_out;
};

} // namespace NameFmt

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "EngineConfiguration.h"

namespace hypotest {

/**
 * @brief The hypotest command line tool.
 *
 * @code
 * hypotest [--config FILE] [--alpha A] [--format text|json] [--log FILE]
 *          [--threads N] <command> <args...>
 *
 *   t-test SAMPLE1 SAMPLE2 [--equal-variance]
 *   anova JSON
 *   chi-square JSON
 *   mann-whitney SAMPLE1 SAMPLE2
 *   power EFFECT N
 *   sample-size EFFECT TARGET_POWER
 *   series TEST SERIES
 *   run TEST DATA [NULL ALT]
 *   batch FILE
 *   quantile normal|t|chi-square|f P [DF1 [DF2]]
 * @endcode
 *
 * Samples are comma separated ("1.2,3.4,5"); JSON arguments are nested
 * arrays ("[[1,2],[3,4]]"). Flags override values from the configuration
 * file. A log file receives a copy of everything written to the output.
 */
class CommandLineApp {
public:
    // Exit statuses returned by run()
    static constexpr int kSuccess = 0;
    static constexpr int kFailure = 1;
    static constexpr int kUsageError = 2;

    /**
     * @brief Parse arguments and execute one command.
     *
     * Errors are reported as "Error: <message>" on err. A batch with failed
     * jobs returns kFailure after writing every result.
     */
    int run(int argc, const char* const argv[], std::ostream& out, std::ostream& err) const;

    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) const;

    static void usage(std::ostream& os);
};

} // namespace hypotest

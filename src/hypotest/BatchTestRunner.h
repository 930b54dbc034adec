#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "EngineConfiguration.h"
#include "StatisticalTestResult.h"

namespace hypotest {

// One entry of a batch file
struct BatchJob {
    std::string id;
    std::string test;
    std::string data;
    std::optional<double> alpha;
    std::string nullHypothesis;
    std::string alternativeHypothesis;
};

// Outcome of one job: a result, or the message of the error that stopped it
struct BatchJobResult {
    std::string id;
    std::string test;
    std::optional<StatisticalTestResult> result;
    std::string error;

    bool succeeded() const { return result.has_value(); }
};

/**
 * @brief Runs a list of hypothesis tests concurrently.
 *
 * Batch files are JSON, either an array of jobs or an object with a "jobs"
 * array:
 * @code
 * { "jobs": [ { "id": "q1", "test": "t-test", "data": "1,2,3|4,5,6",
 *               "alpha": 0.01, "null_hypothesis": "...",
 *               "alternative_hypothesis": "..." } ] }
 * @endcode
 * "data" may also be given as a JSON array for anova and chi-square jobs.
 * Only "test" and "data" are required; a missing id becomes "job-<n>"
 * (1-based).
 */
class BatchTestRunner {
public:
    explicit BatchTestRunner(const EngineConfiguration& config);

    /**
     * @throws InvalidParameterException for malformed JSON or jobs
     */
    static std::vector<BatchJob> parseJobs(const std::string& json);

    static std::vector<BatchJob> loadJobsFromFile(const std::string& path);

    /**
     * @brief Run every job on an executor sized by the configured thread count.
     *
     * Results are returned in job order. A job that throws records the
     * exception message and the remaining jobs still run. One progress line
     * per completed job and a summary line are written to progress.
     */
    std::vector<BatchJobResult> run(const std::vector<BatchJob>& jobs, std::ostream& progress) const;

private:
    EngineConfiguration config_;
};

} // namespace hypotest

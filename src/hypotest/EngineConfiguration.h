#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "NonparametricTests.h"

namespace hypotest {

/**
 * @brief Report formats understood by the command line tool
 */
enum class OutputFormat {
    Text,
    Json
};

std::string outputFormatToString(OutputFormat format);

/**
 * @brief Engine wide settings: default alpha, test options, power search
 * limit, thread count and output options.
 *
 * Loaded from the "engine" object of a JSON document. Keys that are absent
 * keep their default values.
 */
class EngineConfiguration {
public:
    EngineConfiguration();

    /**
     * @brief Load configuration from JSON file
     *
     * @param configPath Path to the configuration file
     * @return true if loaded successfully, false otherwise (see getLastError())
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * @brief Load configuration from JSON string
     *
     * On failure the configuration is left unchanged.
     */
    bool loadFromString(const std::string& jsonContent);

    bool saveToFile(const std::string& configPath) const;

    std::string toJsonString() const;

    double getAlpha() const { return alpha_; }
    void setAlpha(double alpha) { alpha_ = alpha; }

    const MannWhitneyOptions& getMannWhitneyOptions() const { return mannWhitney_; }
    void setMannWhitneyOptions(const MannWhitneyOptions& options) { mannWhitney_ = options; }

    const ChiSquareOptions& getChiSquareOptions() const { return chiSquare_; }
    void setChiSquareOptions(const ChiSquareOptions& options) { chiSquare_ = options; }

    std::size_t getMaxSampleSize() const { return maxSampleSize_; }
    void setMaxSampleSize(std::size_t n) { maxSampleSize_ = n; }

    // 0 means one thread per hardware core
    std::size_t getThreads() const { return threads_; }
    void setThreads(std::size_t threads) { threads_ = threads; }

    OutputFormat getOutputFormat() const { return outputFormat_; }
    void setOutputFormat(OutputFormat format) { outputFormat_ = format; }

    // Empty when output goes to the console only
    const std::string& getLogFile() const { return logFile_; }
    void setLogFile(const std::string& path) { logFile_ = path; }

    /**
     * @brief Check value ranges
     *
     * @return Vector of validation errors (empty if valid)
     */
    std::vector<std::string> validate() const;

    const std::string& getLastError() const { return lastError_; }

    static EngineConfiguration createDefault();

    /**
     * @brief Parse "text" or "json" (case-insensitive)
     * @return false for any other string
     */
    static bool parseOutputFormat(const std::string& text, OutputFormat& format);

private:
    bool parseEngine(const rapidjson::Value& engine);
    void setError(const std::string& error) const { lastError_ = error; }

    double alpha_;
    MannWhitneyOptions mannWhitney_;
    ChiSquareOptions chiSquare_;
    std::size_t maxSampleSize_;
    std::size_t threads_;
    OutputFormat outputFormat_;
    std::string logFile_;
    mutable std::string lastError_;
};

} // namespace hypotest

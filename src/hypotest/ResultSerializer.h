#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "BatchTestRunner.h"
#include "PowerAnalysis.h"
#include "StatisticalTestResult.h"

namespace hypotest {

/**
 * @brief Converts results to pretty printed JSON or to a plain text report.
 *
 * Non-finite numbers are written as JSON null. Timestamps use the ISO 8601
 * extended form in UTC. "degrees_of_freedom" (and the text report's
 * "Degrees of freedom" line) carries one value for the t-test and for
 * Mann-Whitney (n1 + n2 - 2), two for ANOVA and chi-square.
 */
class ResultSerializer {
public:
    static std::string toJson(const StatisticalTestResult& result);
    static std::string toJson(const PowerAnalysisResult& result);

    /**
     * @brief {"jobs": N, "succeeded": S, "failed": F, "results": [...]}
     *
     * Each entry carries "id", "test" and either "result" or "error".
     */
    static std::string toJson(const std::vector<BatchJobResult>& results);

    static void writeText(const StatisticalTestResult& result, std::ostream& os);
    static void writeText(const PowerAnalysisResult& result, std::ostream& os);
    static void writeText(const std::vector<BatchJobResult>& results, std::ostream& os);

private:
    static rapidjson::Value serializeResult(const StatisticalTestResult& result,
                                            rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializePower(const PowerAnalysisResult& result,
                                           rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeParameters(const ParameterList& parameters,
                                                rapidjson::Document::AllocatorType& allocator);
    static std::string write(const rapidjson::Value& value);
};

} // namespace hypotest

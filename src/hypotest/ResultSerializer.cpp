#include "ResultSerializer.h"
#include <cmath>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TestInterpretation.h"

using namespace rapidjson;

namespace hypotest {

namespace {

    Value number(double x) {
        Value v;
        if (std::isfinite(x))
            v.SetDouble(x);
        return v;
    }

    Value text(const std::string& s, Document::AllocatorType& allocator) {
        return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }

    std::string timestamp(const boost::posix_time::ptime& t) {
        return boost::posix_time::to_iso_extended_string(t) + "Z";
    }

    void writeParameters(const ParameterList& parameters, std::ostream& os) {
        if (parameters.empty())
            return;

        os << "Parameters:" << std::endl;
        for (const auto& parameter : parameters)
            os << "  " << parameter.first << ": " << formatSignificant(parameter.second) << std::endl;
    }
}

Value ResultSerializer::serializeParameters(const ParameterList& parameters,
                                            Document::AllocatorType& allocator) {
    Value obj(kObjectType);
    for (const auto& parameter : parameters)
        obj.AddMember(text(parameter.first, allocator), number(parameter.second), allocator);
    return obj;
}

Value ResultSerializer::serializeResult(const StatisticalTestResult& result,
                                        Document::AllocatorType& allocator) {
    Value obj(kObjectType);
    obj.AddMember("test_name", text(result.getTestName(), allocator), allocator);
    obj.AddMember("test_type", text(testTypeToString(result.getTestType()), allocator), allocator);
    obj.AddMember("test_variant", text(result.getTestVariant(), allocator), allocator);
    obj.AddMember("statistic", number(result.getStatistic()), allocator);

    Value df(kArrayType);
    for (double d : result.getDegreesOfFreedom())
        df.PushBack(number(d), allocator);
    obj.AddMember("degrees_of_freedom", df, allocator);

    obj.AddMember("p_value", number(result.getPValue()), allocator);
    obj.AddMember("alpha", number(result.getAlpha()), allocator);
    obj.AddMember("significant", result.isSignificant(), allocator);
    obj.AddMember("null_hypothesis", text(result.getNullHypothesis(), allocator), allocator);
    obj.AddMember("alternative_hypothesis", text(result.getAlternativeHypothesis(), allocator), allocator);
    obj.AddMember("interpretation", text(result.getInterpretation(), allocator), allocator);
    obj.AddMember("parameters", serializeParameters(result.getParameters(), allocator), allocator);

    Value warnings(kArrayType);
    for (const auto& w : result.getWarnings())
        warnings.PushBack(text(w, allocator), allocator);
    obj.AddMember("warnings", warnings, allocator);
    obj.AddMember("low_expected_frequency", result.hasLowExpectedFrequencyWarning(), allocator);

    obj.AddMember("executed_at", text(timestamp(result.getExecutedAt()), allocator), allocator);
    return obj;
}

Value ResultSerializer::serializePower(const PowerAnalysisResult& result,
                                       Document::AllocatorType& allocator) {
    Value obj(kObjectType);
    obj.AddMember("test_type", text(result.getTestType(), allocator), allocator);
    obj.AddMember("effect_size", number(result.getEffectSize()), allocator);
    obj.AddMember("sample_size_per_group", static_cast<uint64_t>(result.getSampleSizePerGroup()), allocator);
    obj.AddMember("power", number(result.getPower()), allocator);
    obj.AddMember("significance_level", number(result.getSignificanceLevel()), allocator);

    if (result.getRequiredSampleSize())
        obj.AddMember("required_sample_size", static_cast<uint64_t>(*result.getRequiredSampleSize()), allocator);
    if (result.getTargetPower())
        obj.AddMember("target_power", number(*result.getTargetPower()), allocator);

    obj.AddMember("parameters", serializeParameters(result.getParameters(), allocator), allocator);
    obj.AddMember("calculated_at", text(timestamp(result.getCalculatedAt()), allocator), allocator);
    return obj;
}

std::string ResultSerializer::write(const Value& value) {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString()) + "\n";
}

std::string ResultSerializer::toJson(const StatisticalTestResult& result) {
    Document doc;
    return write(serializeResult(result, doc.GetAllocator()));
}

std::string ResultSerializer::toJson(const PowerAnalysisResult& result) {
    Document doc;
    return write(serializePower(result, doc.GetAllocator()));
}

std::string ResultSerializer::toJson(const std::vector<BatchJobResult>& results) {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    std::size_t succeeded = 0;
    Value entries(kArrayType);
    for (const auto& r : results) {
        Value entry(kObjectType);
        entry.AddMember("id", text(r.id, allocator), allocator);
        entry.AddMember("test", text(r.test, allocator), allocator);
        if (r.succeeded()) {
            ++succeeded;
            entry.AddMember("result", serializeResult(*r.result, allocator), allocator);
        }
        else {
            entry.AddMember("error", text(r.error, allocator), allocator);
        }
        entries.PushBack(entry, allocator);
    }

    doc.AddMember("jobs", static_cast<uint64_t>(results.size()), allocator);
    doc.AddMember("succeeded", static_cast<uint64_t>(succeeded), allocator);
    doc.AddMember("failed", static_cast<uint64_t>(results.size() - succeeded), allocator);
    doc.AddMember("results", entries, allocator);
    return write(doc);
}

void ResultSerializer::writeText(const StatisticalTestResult& result, std::ostream& os) {
    os << result.getTestName() << " (" << result.getTestVariant() << ")" << std::endl;
    os << "Statistic: " << formatSignificant(result.getStatistic()) << std::endl;

    const auto& df = result.getDegreesOfFreedom();
    if (!df.empty()) {
        os << "Degrees of freedom: ";
        for (std::size_t i = 0; i < df.size(); ++i)
            os << (i ? ", " : "") << formatSignificant(df[i]);
        os << std::endl;
    }

    os << "p-value: " << formatSignificant(result.getPValue()) << std::endl;
    os << "Alpha: " << formatSignificant(result.getAlpha()) << std::endl;
    os << "Null hypothesis: " << result.getNullHypothesis() << std::endl;
    os << "Alternative hypothesis: " << result.getAlternativeHypothesis() << std::endl;
    os << "Result: " << (result.isSignificant() ? "significant" : "not significant") << std::endl;
    os << result.getInterpretation() << std::endl;

    writeParameters(result.getParameters(), os);

    for (const auto& w : result.getWarnings())
        os << "Warning: " << w << std::endl;
}

void ResultSerializer::writeText(const PowerAnalysisResult& result, std::ostream& os) {
    os << "Power analysis (" << result.getTestType() << " t-test)" << std::endl;
    os << "Effect size (Cohen's d): " << formatSignificant(result.getEffectSize()) << std::endl;
    os << "Significance level: " << formatSignificant(result.getSignificanceLevel()) << std::endl;
    if (result.getTargetPower())
        os << "Target power: " << formatSignificant(*result.getTargetPower()) << std::endl;
    if (result.getRequiredSampleSize())
        os << "Required sample size per group: " << *result.getRequiredSampleSize() << std::endl;
    else
        os << "Sample size per group: " << result.getSampleSizePerGroup() << std::endl;
    os << "Power: " << formatSignificant(result.getPower()) << std::endl;

    writeParameters(result.getParameters(), os);
}

void ResultSerializer::writeText(const std::vector<BatchJobResult>& results, std::ostream& os) {
    for (const auto& r : results) {
        os << "=== " << r.id << " (" << r.test << ") ===" << std::endl;
        if (r.succeeded())
            writeText(*r.result, os);
        else
            os << "Error: " << r.error << std::endl;
        os << std::endl;
    }
}

} // namespace hypotest

#include "EngineConfiguration.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "ParametricTests.h"
#include "PowerAnalysis.h"

using namespace rapidjson;

namespace hypotest {

namespace {

    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    // Each reader leaves target alone when the key is absent and returns
    // false with an error message when the key has the wrong type.
    bool readDouble(const Value& obj, const char* key, double& target, std::string& error) {
        if (!obj.HasMember(key))
            return true;
        if (!obj[key].IsNumber()) {
            error = std::string("'") + key + "' must be a number";
            return false;
        }
        target = obj[key].GetDouble();
        return true;
    }

    bool readSize(const Value& obj, const char* key, std::size_t& target, std::string& error) {
        if (!obj.HasMember(key))
            return true;
        if (!obj[key].IsUint64()) {
            error = std::string("'") + key + "' must be a non-negative integer";
            return false;
        }
        target = static_cast<std::size_t>(obj[key].GetUint64());
        return true;
    }

    bool readBool(const Value& obj, const char* key, bool& target, std::string& error) {
        if (!obj.HasMember(key))
            return true;
        if (!obj[key].IsBool()) {
            error = std::string("'") + key + "' must be true or false";
            return false;
        }
        target = obj[key].GetBool();
        return true;
    }

    bool readString(const Value& obj, const char* key, std::string& target, std::string& error) {
        if (!obj.HasMember(key))
            return true;
        if (!obj[key].IsString()) {
            error = std::string("'") + key + "' must be a string";
            return false;
        }
        target = obj[key].GetString();
        return true;
    }

    bool readObject(const Value& obj, const char* key, const Value*& target, std::string& error) {
        target = nullptr;
        if (!obj.HasMember(key))
            return true;
        if (!obj[key].IsObject()) {
            error = std::string("'") + key + "' must be an object";
            return false;
        }
        target = &obj[key];
        return true;
    }
}

std::string outputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text:
            return "text";
        case OutputFormat::Json:
            return "json";
    }
    return "text";
}

EngineConfiguration::EngineConfiguration()
    : alpha_(kDefaultAlpha),
      mannWhitney_(),
      chiSquare_(),
      maxSampleSize_(kDefaultMaxSampleSize),
      threads_(0),
      outputFormat_(OutputFormat::Text),
      logFile_() {
}

bool EngineConfiguration::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return loadFromString(buffer.str());
}

bool EngineConfiguration::loadFromString(const std::string& jsonContent) {
    Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError()) {
        setError(std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
                 ": " + GetParseError_En(doc.GetParseError()));
        return false;
    }

    if (!doc.IsObject() || !doc.HasMember("engine") || !doc["engine"].IsObject()) {
        setError("Missing 'engine' section in configuration");
        return false;
    }

    // Parse into a copy so that a bad file leaves this configuration untouched
    EngineConfiguration parsed(*this);
    if (!parsed.parseEngine(doc["engine"])) {
        setError(parsed.getLastError());
        return false;
    }

    const std::vector<std::string> errors = parsed.validate();
    if (!errors.empty()) {
        setError(errors.front());
        return false;
    }

    parsed.lastError_.clear();
    *this = parsed;
    return true;
}

bool EngineConfiguration::parseEngine(const Value& engine) {
    std::string error;
    std::string format = outputFormatToString(outputFormat_);
    const Value* mannWhitney = nullptr;
    const Value* chiSquare = nullptr;
    const Value* power = nullptr;

    const bool ok =
        readDouble(engine, "alpha", alpha_, error) &&
        readSize(engine, "threads", threads_, error) &&
        readString(engine, "output_format", format, error) &&
        readString(engine, "log_file", logFile_, error) &&
        readObject(engine, "mann_whitney", mannWhitney, error) &&
        readObject(engine, "chi_square", chiSquare, error) &&
        readObject(engine, "power", power, error) &&
        (!mannWhitney || readSize(*mannWhitney, "exact_threshold", mannWhitney_.exactThreshold, error)) &&
        (!mannWhitney || readBool(*mannWhitney, "continuity_correction", mannWhitney_.continuityCorrection, error)) &&
        (!chiSquare || readDouble(*chiSquare, "min_expected_frequency", chiSquare_.minExpectedFrequency, error)) &&
        (!power || readSize(*power, "max_sample_size", maxSampleSize_, error));

    if (!ok) {
        setError("Invalid configuration: " + error);
        return false;
    }

    if (!parseOutputFormat(format, outputFormat_)) {
        setError("Invalid configuration: unknown output_format '" + format + "'");
        return false;
    }

    return true;
}

bool EngineConfiguration::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open file for writing: " + configPath);
        return false;
    }

    file << toJsonString();
    file.close();
    return true;
}

std::string EngineConfiguration::toJsonString() const {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("engine");
    writer.StartObject();

    writer.Key("alpha");
    writer.Double(alpha_);

    writer.Key("mann_whitney");
    writer.StartObject();
    writer.Key("exact_threshold");
    writer.Uint64(mannWhitney_.exactThreshold);
    writer.Key("continuity_correction");
    writer.Bool(mannWhitney_.continuityCorrection);
    writer.EndObject();

    writer.Key("chi_square");
    writer.StartObject();
    writer.Key("min_expected_frequency");
    writer.Double(chiSquare_.minExpectedFrequency);
    writer.EndObject();

    writer.Key("power");
    writer.StartObject();
    writer.Key("max_sample_size");
    writer.Uint64(maxSampleSize_);
    writer.EndObject();

    writer.Key("threads");
    writer.Uint64(threads_);
    writer.Key("output_format");
    writer.String(outputFormatToString(outputFormat_).c_str());
    writer.Key("log_file");
    writer.String(logFile_.c_str());

    writer.EndObject();
    writer.EndObject();

    return std::string(buffer.GetString()) + "\n";
}

std::vector<std::string> EngineConfiguration::validate() const {
    std::vector<std::string> errors;

    if (!(alpha_ > 0.0 && alpha_ < 1.0))
        errors.push_back("alpha must be in (0, 1)");

    if (mannWhitney_.exactThreshold > kMaxMannWhitneyExactThreshold)
        errors.push_back("mann_whitney.exact_threshold must be at most " +
                         std::to_string(kMaxMannWhitneyExactThreshold));

    if (!std::isfinite(chiSquare_.minExpectedFrequency) || chiSquare_.minExpectedFrequency < 0.0)
        errors.push_back("chi_square.min_expected_frequency must be a non-negative number");

    if (maxSampleSize_ < 2)
        errors.push_back("power.max_sample_size must be at least 2");

    return errors;
}

EngineConfiguration EngineConfiguration::createDefault() {
    return EngineConfiguration();
}

bool EngineConfiguration::parseOutputFormat(const std::string& text, OutputFormat& format) {
    const std::string lower = toLower(text);
    if (lower == "text") {
        format = OutputFormat::Text;
        return true;
    }
    if (lower == "json") {
        format = OutputFormat::Json;
        return true;
    }
    return false;
}

} // namespace hypotest

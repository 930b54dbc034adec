#include "InputParsing.h"
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include "HypothesisTestException.h"

using namespace rapidjson;

namespace hypotest {

namespace {

    std::string trim(const std::string& text) {
        std::size_t first = 0;
        while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first])))
            ++first;

        std::size_t last = text.size();
        while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])))
            --last;

        return text.substr(first, last - first);
    }

    std::vector<std::string> split(const std::string& text, char delimiter) {
        std::vector<std::string> parts;
        std::size_t start = 0;
        for (;;) {
            const std::size_t pos = text.find(delimiter, start);
            if (pos == std::string::npos) {
                parts.push_back(text.substr(start));
                break;
            }
            parts.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }
}

double parseNumber(const std::string& text, const std::string& what) {
    const std::string token = trim(text);
    if (token.empty())
        throw InvalidParameterException("Empty value for " + what);

    std::size_t consumed = 0;
    double value;
    try {
        value = std::stod(token, &consumed);
    }
    catch (const std::invalid_argument&) {
        throw InvalidParameterException("Invalid number for " + what + ": '" + token + "'");
    }
    catch (const std::out_of_range&) {
        throw InvalidParameterException("Number out of range for " + what + ": '" + token + "'");
    }

    if (consumed != token.size())
        throw InvalidParameterException("Invalid number for " + what + ": '" + token + "'");
    if (!std::isfinite(value))
        throw InvalidParameterException("Non-finite value for " + what + ": '" + token + "'");

    return value;
}

std::size_t parseCount(const std::string& text, const std::string& what) {
    const double value = parseNumber(text, what);
    if (value < 0.0 || std::floor(value) != value)
        throw InvalidParameterException(what + " must be a non-negative integer, got '" + trim(text) + "'");
    // SIZE_MAX rounds up to 2^64 as a double, so that value is already out of range
    if (value >= static_cast<double>(std::numeric_limits<std::size_t>::max()))
        throw InvalidParameterException(what + " is too large, got '" + trim(text) + "'");
    return static_cast<std::size_t>(value);
}

Sample parseSample(const std::string& text) {
    if (trim(text).empty())
        throw InvalidParameterException("Sample is empty");

    Sample sample;
    for (const std::string& token : split(text, ','))
        sample.push_back(parseNumber(token, "sample value"));

    return sample;
}

std::pair<Sample, Sample> parseTwoSamples(const std::string& text) {
    const std::vector<std::string> parts = split(text, '|');
    if (parts.size() != 2)
        throw InvalidParameterException("Two-sample data must have the form 'a,b,c|d,e,f'");

    return {parseSample(parts[0]), parseSample(parts[1])};
}

std::vector<std::vector<double>> parseNestedArrays(const std::string& json) {
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
        throw InvalidParameterException(std::string("Invalid JSON data at offset ") +
                                        std::to_string(doc.GetErrorOffset()) + ": " +
                                        GetParseError_En(doc.GetParseError()));

    if (!doc.IsArray())
        throw InvalidParameterException("JSON data must be an array of numeric arrays");

    std::vector<std::vector<double>> rows;
    rows.reserve(doc.Size());

    for (SizeType i = 0; i < doc.Size(); ++i) {
        const Value& row = doc[i];
        if (!row.IsArray())
            throw InvalidParameterException("JSON data element " + std::to_string(i) + " is not an array");

        std::vector<double> values;
        values.reserve(row.Size());
        for (SizeType j = 0; j < row.Size(); ++j) {
            if (!row[j].IsNumber())
                throw InvalidParameterException("JSON data element [" + std::to_string(i) + "][" +
                                                std::to_string(j) + "] is not a number");
            values.push_back(row[j].GetDouble());
        }
        rows.push_back(std::move(values));
    }

    return rows;
}

std::vector<Sample> parseGroups(const std::string& json) {
    return parseNestedArrays(json);
}

ContingencyTable parseContingencyTable(const std::string& json) {
    return parseNestedArrays(json);
}

} // namespace hypotest

#pragma once

#include <string>
#include <utility>
#include <vector>
#include "NonparametricTests.h"
#include "SampleStatistics.h"

namespace hypotest {

/**
 * @brief Decoders for the text encodings the command line and batch files use.
 *
 * Every function throws InvalidParameterException with a message naming the
 * offending token when the text cannot be decoded.
 */

// "1.5, 2, 3e-1" -> {1.5, 2.0, 0.3}. Whitespace around values is ignored.
Sample parseSample(const std::string& text);

// "a,b,c|d,e,f" -> two samples. Exactly one '|' is required.
std::pair<Sample, Sample> parseTwoSamples(const std::string& text);

// JSON array of numeric arrays, e.g. "[[1,2,3],[4,5,6]]". Rows may differ in length.
std::vector<std::vector<double>> parseNestedArrays(const std::string& json);

// Nested arrays read as ANOVA groups
std::vector<Sample> parseGroups(const std::string& json);

// Nested arrays read as contingency table rows
ContingencyTable parseContingencyTable(const std::string& json);

// Parse one finite double; "what" names the value in error messages
double parseNumber(const std::string& text, const std::string& what);

// Parse a non-negative integer
std::size_t parseCount(const std::string& text, const std::string& what);

} // namespace hypotest

// File: src/mining/value_coercion.hpp
#pragma once

#include "core/behavior_log.hpp"
#include <string>

namespace policyminer {

/// Convert a context value to the string used as an antecedent value
///
/// This is the only place where context values lose their type. Distinct
/// values that render identically (the integer 1 and the text "1") collapse
/// into the same antecedent. Rendering rules:
/// - string: verbatim, no case or whitespace normalization
/// - integer: decimal
/// - real: shortest round-trip digits, "1.0" for integral values, exponent
///   form ("1e-05", "1e+16") outside [1e-4, 1e16)
/// - boolean: "True" / "False"
/// - null: "None"
/// - array / object: "[1, 'a']" / "{'k': 1}" with nested strings quoted
std::string ToAntecedentValue(const ContextValue& value);

/// Quote a string for display in a policy description
///
/// Single quotes unless the text contains a single quote and no double
/// quote. Backslashes, the chosen quote, \n, \r and \t are escaped; other
/// control characters are written as \xNN. Non-ASCII UTF-8 passes through
/// except for C1 controls, non-space separators, format characters and
/// private-use code points, which become \xNN, \uNNNN or \UNNNNNNNN.
std::string ReprQuote(const std::string& text);

/// Shortest round-trip rendering of a double ("0.1", "2.0", "1e-05")
std::string FormatReal(double value);

} // namespace policyminer

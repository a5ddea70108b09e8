#pragma once

#include "metrics/MetricsRecord.hpp"

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace greekeval::metrics
{

// JSON form of MetricsRecord. Keys are the record's field names, with
// word_operations and diacritics as nested objects. Percentages are written
// rounded to two decimals.
class MetricsSerializer
{
public:
    static nlohmann::json toJson(const MetricsRecord& record);

    // indent < 0 gives the compact single-line form
    static std::string toJsonString(const MetricsRecord& record, int indent = 2);

    // Reads a record written by toJson. On malformed JSON, a missing metric or
    // an unknown orthography name, returns false and leaves outRecord untouched.
    static bool parse(const std::string& jsonContent, MetricsRecord& outRecord, std::string& outError);

    // Two-decimal rounding applied to every percentage on output
    static double roundPercentage(double value);
};

} // namespace greekeval::metrics

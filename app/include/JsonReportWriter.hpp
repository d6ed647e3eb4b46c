#ifndef JSON_REPORT_WRITER_HPP
#define JSON_REPORT_WRITER_HPP

#include "SizeReport.hpp"
#include "Types.hpp"

#include <json/json.h>
#include <string>
#include <vector>

class JsonReportWriter {
public:
    static Json::Value duplicates_to_json(const DuplicateGroups& groups,
                                          const std::vector<ScanError>& scan_errors);
    static Json::Value comparison_to_json(const ComparisonResult& result);
    static Json::Value size_breakdown_to_json(const SizeBreakdown& breakdown);

    static std::string to_string(const Json::Value& value);

    /**
     * @brief Writes the document to path. Throws ErrorCodes::AppException
     *        (FILE_WRITE_FAILED) when the file cannot be written.
     */
    static void write_file(const std::string& path, const Json::Value& value);

private:
    static Json::Value file_to_json(const FileDescriptor& file);
    static Json::Value scan_errors_to_json(const std::vector<ScanError>& errors);
};

#endif

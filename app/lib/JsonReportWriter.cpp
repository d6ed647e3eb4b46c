#include "JsonReportWriter.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fstream>

Json::Value JsonReportWriter::file_to_json(const FileDescriptor& file)
{
    Json::Value obj(Json::objectValue);
    obj["path"] = file.path();
    obj["name"] = file.name();
    obj["size"] = Json::UInt64(file.size());
    obj["modified"] = Utils::format_file_time(file.modification_time());
    return obj;
}


Json::Value JsonReportWriter::scan_errors_to_json(const std::vector<ScanError>& errors)
{
    Json::Value arr(Json::arrayValue);
    for (const auto& error : errors) {
        Json::Value obj(Json::objectValue);
        obj["path"] = error.path;
        obj["cause"] = error.cause;
        arr.append(obj);
    }
    return arr;
}


Json::Value JsonReportWriter::duplicates_to_json(const DuplicateGroups& groups,
                                                 const std::vector<ScanError>& scan_errors)
{
    Json::Value root(Json::objectValue);
    Json::Value groups_json(Json::arrayValue);
    std::uintmax_t wasted = 0;
    for (const auto& [fingerprint, group] : groups) {
        Json::Value group_json(Json::objectValue);
        group_json["fingerprint"] = fingerprint;
        group_json["size"] = Json::UInt64(group.size);
        group_json["wasted_bytes"] = Json::UInt64(group.wasted_bytes());
        Json::Value files(Json::arrayValue);
        for (const auto& file : group.files) {
            files.append(file_to_json(*file));
        }
        group_json["files"] = files;
        groups_json.append(group_json);
        wasted += group.wasted_bytes();
    }
    root["groups"] = groups_json;
    root["wasted_bytes"] = Json::UInt64(wasted);
    root["skipped"] = scan_errors_to_json(scan_errors);
    return root;
}


Json::Value JsonReportWriter::comparison_to_json(const ComparisonResult& result)
{
    Json::Value root(Json::objectValue);
    Json::Value duplicates(Json::arrayValue);
    for (const auto& file : result.duplicates) {
        duplicates.append(file_to_json(*file));
    }
    Json::Value unique(Json::arrayValue);
    for (const auto& file : result.unique) {
        unique.append(file_to_json(*file));
    }
    root["duplicates"] = duplicates;
    root["unique"] = unique;
    root["skipped"] = scan_errors_to_json(result.scan_errors);
    return root;
}


Json::Value JsonReportWriter::size_breakdown_to_json(const SizeBreakdown& breakdown)
{
    Json::Value root(Json::objectValue);
    Json::Value categories(Json::arrayValue);
    for (const auto& category : breakdown.categories) {
        Json::Value obj(Json::objectValue);
        obj["category"] = category.category;
        obj["files"] = Json::UInt64(category.file_count);
        obj["bytes"] = Json::UInt64(category.total_bytes);
        categories.append(obj);
    }
    root["categories"] = categories;
    root["total_files"] = Json::UInt64(breakdown.total_files);
    root["total_bytes"] = Json::UInt64(breakdown.total_bytes);
    return root;
}


std::string JsonReportWriter::to_string(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}


void JsonReportWriter::write_file(const std::string& path, const Json::Value& value)
{
    std::ofstream out(Utils::utf8_to_path(path), std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, path);
    }
    out << to_string(value) << '\n';
    out.flush();
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, path);
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Wrote JSON report to '{}'", path);
    }
}

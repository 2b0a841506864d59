// ==============================================================================
// report.cpp - Текстовый отчёт сбора
// ==============================================================================

#include "codecollector/report.hpp"

#include "codecollector/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace codecollector::report {

namespace {

constexpr const char* REPORT_TITLE = "# Code Collection Report";

// Первые байты, в которых ищется NUL для определения бинарного файла
constexpr std::size_t BINARY_PROBE_BYTES = 8192;

struct FileContent {
    bool ok = false;
    bool binary = false;
    std::string data;
    std::string error;
};

FileContent read_content(const std::filesystem::path& path) {
    FileContent result;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        result.error = "cannot open file";
        return result;
    }
    result.data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        result.error = "read error";
        return result;
    }

    std::size_t probe = std::min(result.data.size(), BINARY_PROBE_BYTES);
    result.binary = result.data.find('\0') < probe;
    result.ok = true;
    return result;
}

std::string relative_name(const std::filesystem::path& file, const std::filesystem::path& root) {
    std::filesystem::path rel = file.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return platform::generic_utf8(file);
    }
    return platform::generic_utf8(rel);
}

/// Тело секции файла: содержимое или маркер
std::string section_body(const FileContent& content) {
    if (!content.ok) {
        return "[unreadable: " + content.error + "]\n";
    }
    if (content.binary) {
        return "[binary file skipped]\n";
    }
    std::string body = content.data;
    if (!body.empty() && body.back() != '\n') {
        body += '\n';
    }
    return body;
}

}  // namespace

// ----------------------------------------------------------------------------
// Layout
// ----------------------------------------------------------------------------

const char* layout_to_string(Layout layout) {
    switch (layout) {
    case Layout::Indexed:
        return "indexed";
    case Layout::Standard:
    default:
        return "standard";
    }
}

std::optional<Layout> parse_layout(std::string_view name) {
    if (name == "standard") {
        return Layout::Standard;
    }
    if (name == "indexed") {
        return Layout::Indexed;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// TextFormatter
// ----------------------------------------------------------------------------

WriteStatus TextFormatter::write(const io::ScanResult& files, const std::filesystem::path& root,
                                 const std::filesystem::path& out) {
    WriteStatus status;

    std::error_code ec;
    if (out.has_parent_path()) {
        std::filesystem::create_directories(out.parent_path(), ec);
    }

    std::ofstream stream(out, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        status.error = "failed to open report file '" + platform::path_to_utf8(out) + "'";
        return status;
    }

    std::uintmax_t total_size = 0;
    for (const auto& file : files) {
        std::error_code size_ec;
        auto size = std::filesystem::file_size(file, size_ec);
        if (!size_ec) {
            total_size += size;
        }
    }

    stream << REPORT_TITLE << "\n";
    stream << "Project Path: " << platform::path_to_utf8(root) << "\n";
    stream << "File Count: " << files.size() << "\n";
    stream << "Generated At: " << platform::now_iso8601() << "\n";
    stream << "Total Size: " << format_bytes(static_cast<std::int64_t>(total_size)) << "\n";
    stream << "\n";

    std::size_t idx = 0;
    for (const auto& file : files) {
        ++idx;
        const std::string name = relative_name(file, root);
        const FileContent content = read_content(file);

        if (layout_ == Layout::Indexed) {
            stream << "####### [idx:" << idx << "] " << name << "\n";
            stream << section_body(content);
            stream << "####### [end:" << idx << "]\n\n";
        } else {
            stream << "## File: " << name << "\n";
            stream << "Size: " << format_bytes(static_cast<std::int64_t>(content.data.size()))
                   << "\n";
            stream << "```" << language_tag(file) << "\n";
            stream << section_body(content);
            stream << "```\n\n";
        }
    }

    stream.close();
    if (stream.fail()) {
        status.error = "failed to write report file '" + platform::path_to_utf8(out) + "'";
        return status;
    }

    status.ok = true;
    return status;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_bytes(std::int64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr std::size_t unit_count = sizeof(units) / sizeof(units[0]);

    const bool negative = bytes < 0;
    double value = negative ? -static_cast<double>(bytes) : static_cast<double>(bytes);

    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < unit_count) {
        value /= 1024.0;
        ++unit;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s%.2f %s", negative ? "-" : "", value, units[unit]);
    return buf;
}

std::string language_tag(const std::filesystem::path& file) {
    static const std::unordered_map<std::string, std::string> tags = {
        {".py", "python"},     {".pyi", "python"},  {".js", "javascript"}, {".jsx", "jsx"},
        {".mjs", "javascript"}, {".ts", "typescript"}, {".tsx", "tsx"},     {".c", "c"},
        {".h", "c"},           {".cc", "cpp"},      {".cpp", "cpp"},       {".cxx", "cpp"},
        {".hpp", "cpp"},       {".hh", "cpp"},      {".java", "java"},     {".kt", "kotlin"},
        {".cs", "csharp"},     {".go", "go"},       {".rs", "rust"},       {".rb", "ruby"},
        {".php", "php"},       {".swift", "swift"}, {".sh", "bash"},       {".bash", "bash"},
        {".html", "html"},     {".css", "css"},     {".scss", "scss"},     {".json", "json"},
        {".yaml", "yaml"},     {".yml", "yaml"},    {".toml", "toml"},     {".xml", "xml"},
        {".sql", "sql"},       {".md", "markdown"}, {".lua", "lua"},       {".cmake", "cmake"},
    };

    const std::string ext = platform::path_to_utf8(file.extension());
    auto it = tags.find(ext);
    return it != tags.end() ? it->second : std::string();
}

}  // namespace codecollector::report

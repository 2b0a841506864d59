// ==============================================================================
// collect.cpp - Конвейер сбора
// ==============================================================================

#include "codecollector/collect.hpp"

#include "codecollector/platform.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace codecollector::collect {

namespace {

std::filesystem::path absolute_output(const std::filesystem::path& output) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(output, ec);
    return ec ? output : abs.lexically_normal();
}

// Убирает из результата всё, что лежит внутри dir
void drop_under(io::ScanResult& files, const std::filesystem::path& dir) {
    const std::string prefix = platform::generic_utf8(io::normalize_root(dir)) + "/";
    files.erase(std::remove_if(files.begin(), files.end(),
                               [&prefix](const std::filesystem::path& p) {
                                   return platform::generic_utf8(p).compare(0, prefix.size(),
                                                                            prefix) == 0;
                               }),
                files.end());
}

}  // namespace

const char* error_kind_to_string(CollectErrorKind kind) {
    switch (kind) {
    case CollectErrorKind::CacheUnavailable:
        return "cache unavailable";
    case CollectErrorKind::OutputWriteFailed:
        return "output write failed";
    case CollectErrorKind::ReportWriteFailed:
    default:
        return "report write failed";
    }
}

// ----------------------------------------------------------------------------
// Pipeline
// ----------------------------------------------------------------------------

Pipeline::Pipeline(cache::CacheStore& cache, report::Formatter& formatter, PipelineHooks hooks)
    : cache_(cache), formatter_(formatter), hooks_(std::move(hooks)) {}

void Pipeline::debug(const std::string& message) const {
    if (hooks_.debug) {
        hooks_.debug(message);
    }
}

void Pipeline::warn(const std::string& message) const {
    if (hooks_.warn) {
        hooks_.warn(message);
    }
}

bool Pipeline::deliver(const std::filesystem::path& from, const std::filesystem::path& to,
                       std::string& error) const {
    std::error_code ec;
    if (std::filesystem::equivalent(from, to, ec) && !ec) {
        return true;
    }

    if (to.has_parent_path()) {
        std::filesystem::create_directories(to.parent_path(), ec);
    }

    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "failed to write output file '" + platform::path_to_utf8(to) + "' - " +
                ec.message();
        return false;
    }
    return true;
}

CollectResult Pipeline::collect(const CollectRequest& request) {
    CollectResult result;

    const std::filesystem::path root = io::normalize_root(request.root);
    const std::filesystem::path output = absolute_output(request.output);

    // CACHE_CHECK
    if (request.use_cache) {
        result.key = cache::CacheStore::make_key(root, request.patterns, formatter_.name());

        if (auto entry = cache_.lookup(result.key)) {
            const std::filesystem::path artifact = cache_.artifact_path(*entry);
            std::error_code ec;
            if (std::filesystem::is_regular_file(artifact, ec)) {
                debug("cache hit: " + result.key);

                std::string error;
                if (!deliver(artifact, output, error)) {
                    result.error = {CollectErrorKind::OutputWriteFailed, error};
                    return result;
                }
                result.ok = true;
                result.cache_hit = true;
                result.file_count = static_cast<std::size_t>(entry->file_count);
                result.report_path = output;
                return result;
            }
            // Индекс ссылается на удалённый артефакт - считаем промахом
            debug("cache artifact missing for " + result.key + ", rebuilding");
        } else {
            debug("cache miss: " + result.key);
        }

        cache::CacheResult dir = cache_.ensure_directory();
        if (!dir.ok) {
            result.error = {CollectErrorKind::CacheUnavailable, dir.error.message};
            return result;
        }
    }

    // SCAN
    io::ScanOptions scan_opt;
    scan_opt.warn = hooks_.warn;
    io::ScanResult files = io::scan(root, request.patterns, scan_opt);

    // Отчёт предыдущего запуска и артефакты кэша не должны попадать в новый
    files.erase(std::remove(files.begin(), files.end(), output), files.end());
    drop_under(files, cache_.directory());
    debug("scanned " + std::to_string(files.size()) + " files under " +
          platform::path_to_utf8(root));

    result.file_count = files.size();

    // WRITE_REPORT
    if (!request.use_cache) {
        report::WriteStatus status = formatter_.write(files, root, output);
        if (!status.ok) {
            result.error = {CollectErrorKind::ReportWriteFailed, status.error};
            return result;
        }
        result.ok = true;
        result.report_path = output;
        return result;
    }

    const std::string artifact_name = cache::CacheStore::artifact_name(result.key);
    const std::filesystem::path artifact = cache_.directory() / artifact_name;
    const std::filesystem::path partial = cache_.directory() / (artifact_name + ".tmp");

    // Артефакт появляется под своим именем только целиком
    report::WriteStatus status = formatter_.write(files, root, partial);
    std::error_code rename_ec;
    if (status.ok) {
        std::filesystem::rename(partial, artifact, rename_ec);
        if (rename_ec) {
            status.ok = false;
            status.error = "failed to move cache artifact into place '" +
                           platform::path_to_utf8(artifact) + "' - " + rename_ec.message();
        }
    }
    if (!status.ok) {
        std::error_code rm_ec;
        std::filesystem::remove(partial, rm_ec);
        result.error = {CollectErrorKind::ReportWriteFailed, status.error};
        return result;
    }

    std::string error;
    if (!deliver(artifact, output, error)) {
        result.error = {CollectErrorKind::OutputWriteFailed, error};
        return result;
    }

    // CACHE_STORE
    cache::CacheEntry entry;
    entry.key = result.key;
    entry.report_file = artifact_name;
    entry.project_path = platform::generic_utf8(root);
    entry.created_at = platform::now_iso8601();
    entry.file_count = files.size();

    cache::CacheResult stored = cache_.store(entry);
    if (!stored.ok) {
        // Отчёт уже создан; без индекса следующий запуск просто будет промахом
        warn(stored.error.message);
    }

    result.ok = true;
    result.report_path = output;
    return result;
}

}  // namespace codecollector::collect

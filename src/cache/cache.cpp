// ==============================================================================
// cache.cpp - Кэш результатов сбора
// ==============================================================================
//
// Формат cache_index.json:
//
//   {
//     "<key>": {
//       "file": "cache_<key>.txt",
//       "project_path": "/abs/root",
//       "created_at": "2026-01-01T12:00:00",
//       "file_count": 3
//     }
//   }
//
// Неизвестные поля игнорируются. Записи без "file" пропускаются.
//
// ==============================================================================

#include "codecollector/cache.hpp"

#include "codecollector/discovery.hpp"
#include "codecollector/md5.hpp"
#include "codecollector/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <system_error>
#include <utility>

namespace codecollector::cache {

namespace {

// Разделитель шаблонов в каноническом тексте (не встречается в glob)
constexpr char PATTERN_SEPARATOR = '\x1f';

std::string canonical_patterns(std::vector<std::string> patterns) {
    std::sort(patterns.begin(), patterns.end());
    patterns.erase(std::unique(patterns.begin(), patterns.end()), patterns.end());

    std::string joined;
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        if (i > 0) {
            joined += PATTERN_SEPARATOR;
        }
        joined += patterns[i];
    }
    return joined;
}

/// Имя файла без компонентов директории (защита от "../" в индексе)
bool is_plain_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

bool read_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

}  // namespace

// ----------------------------------------------------------------------------
// Ключи и хэши
// ----------------------------------------------------------------------------

std::string CacheStore::compute_project_hash(const std::filesystem::path& root,
                                             const std::vector<std::string>& include,
                                             const std::vector<std::string>& exclude,
                                             const std::vector<std::string>& file_types,
                                             std::string_view variant) {
    // Корень входит в хэш без приведения регистра: slug может совпасть у
    // разных корней, ключ - нет
    std::string canonical;
    canonical += "root=" + platform::generic_utf8(io::normalize_root(root)) + "\n";
    canonical += "include=" + canonical_patterns(include) + "\n";
    canonical += "exclude=" + canonical_patterns(exclude) + "\n";
    canonical += "file_types=" + canonical_patterns(file_types) + "\n";
    if (!variant.empty()) {
        canonical += "variant=" + std::string(variant) + "\n";
    }

    return md5_hex(canonical).substr(0, PROJECT_HASH_LENGTH);
}

std::string CacheStore::project_slug(const std::filesystem::path& root) {
    const std::filesystem::path normalized = io::normalize_root(root);
    std::string name = platform::path_to_utf8(normalized.filename());

    std::string slug;
    slug.reserve(name.size());
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) != 0 && c < 0x80) {
            slug += static_cast<char>(std::tolower(c));
        } else if (ch == '-') {
            slug += ch;
        } else if (slug.empty() || slug.back() != '_') {
            // '_' и все прочие символы схлопываются в один '_'
            slug += '_';
        }
    }

    // Обрезаем '_' по краям
    std::size_t first = slug.find_first_not_of('_');
    if (first == std::string::npos) {
        return "project";
    }
    std::size_t last = slug.find_last_not_of('_');
    return slug.substr(first, last - first + 1);
}

std::string CacheStore::make_key(const std::filesystem::path& root, const io::PatternSet& patterns,
                                 std::string_view variant) {
    return project_slug(root) + "_" +
           compute_project_hash(root, patterns.include, patterns.exclude, patterns.file_types,
                                variant);
}

std::string CacheStore::artifact_name(const std::string& key) {
    return "cache_" + key + ".txt";
}

std::string CacheStore::file_hash(const std::filesystem::path& path) {
    return md5_file_hex(path);
}

// ----------------------------------------------------------------------------
// Конструктор и загрузка индекса
// ----------------------------------------------------------------------------

CacheStore::CacheStore(CacheConfig cfg)
    : config_(std::move(cfg)),
      dir_(config_.cache_dir.empty() ? std::filesystem::path(DEFAULT_CACHE_DIR)
                                     : config_.cache_dir),
      index_path_(dir_ / INDEX_FILE_NAME) {
    load_index();
}

void CacheStore::warn(const std::string& message) const {
    if (config_.warn) {
        config_.warn(message);
    }
}

void CacheStore::load_index() {
    index_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(index_path_, ec) || ec) {
        // Нет индекса - пустой кэш
        return;
    }

    std::string content;
    if (!read_file(index_path_, content)) {
        warn("failed to read cache index '" + platform::path_to_utf8(index_path_) +
             "' - starting with an empty cache");
        return;
    }

    rapidjson::Document doc;
    doc.Parse(content.c_str(), content.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        warn("cache index '" + platform::path_to_utf8(index_path_) +
             "' is corrupted - starting with an empty cache");
        return;
    }

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        if (!it->value.IsObject()) {
            continue;
        }
        const auto& obj = it->value;

        auto file_it = obj.FindMember("file");
        if (file_it == obj.MemberEnd() || !file_it->value.IsString()) {
            continue;
        }

        CacheEntry entry;
        entry.key.assign(it->name.GetString(), it->name.GetStringLength());
        entry.report_file.assign(file_it->value.GetString(), file_it->value.GetStringLength());

        // Имя артефакта однозначно определяется ключом
        if (entry.report_file != artifact_name(entry.key)) {
            warn("ignoring cache entry '" + entry.key + "' with unexpected artifact '" +
                 entry.report_file + "'");
            continue;
        }

        auto path_it = obj.FindMember("project_path");
        if (path_it != obj.MemberEnd() && path_it->value.IsString()) {
            entry.project_path = path_it->value.GetString();
        }
        auto created_it = obj.FindMember("created_at");
        if (created_it != obj.MemberEnd() && created_it->value.IsString()) {
            entry.created_at = created_it->value.GetString();
        }
        auto count_it = obj.FindMember("file_count");
        if (count_it != obj.MemberEnd() && count_it->value.IsUint64()) {
            entry.file_count = count_it->value.GetUint64();
        }

        std::string key = entry.key;
        index_[key] = std::move(entry);
    }
}

// ----------------------------------------------------------------------------
// Сохранение индекса
// ----------------------------------------------------------------------------

CacheResult CacheStore::save_index() {
    CacheResult result;

    CacheResult dir_result = ensure_directory();
    if (!dir_result.ok) {
        return dir_result;
    }

    std::vector<std::string> keys;
    keys.reserve(index_.size());
    for (const auto& kv : index_) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    for (const auto& key : keys) {
        const CacheEntry& entry = index_.at(key);
        writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        writer.StartObject();
        writer.Key("file");
        writer.String(entry.report_file.c_str(),
                      static_cast<rapidjson::SizeType>(entry.report_file.size()));
        writer.Key("project_path");
        writer.String(entry.project_path.c_str(),
                      static_cast<rapidjson::SizeType>(entry.project_path.size()));
        writer.Key("created_at");
        writer.String(entry.created_at.c_str(),
                      static_cast<rapidjson::SizeType>(entry.created_at.size()));
        writer.Key("file_count");
        writer.Uint64(entry.file_count);
        writer.EndObject();
    }
    writer.EndObject();

    // Временный файл + rename: читатель видит либо старый, либо новый индекс
    std::filesystem::path tmp_path = index_path_;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            result.error = {CacheErrorKind::IndexWriteFailed,
                            "failed to write cache index '" + platform::path_to_utf8(tmp_path) +
                                "'"};
            return result;
        }
        out.write(buffer.GetString(), static_cast<std::streamsize>(buffer.GetSize()));
        out.put('\n');
        out.close();
        if (out.fail()) {
            result.error = {CacheErrorKind::IndexWriteFailed,
                            "failed to write cache index '" + platform::path_to_utf8(tmp_path) +
                                "'"};
            return result;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, index_path_, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        result.error = {CacheErrorKind::IndexWriteFailed, "failed to replace cache index '" +
                                                              platform::path_to_utf8(index_path_) +
                                                              "' - " + ec.message()};
        return result;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Операции над индексом
// ----------------------------------------------------------------------------

std::optional<CacheEntry> CacheStore::lookup(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

CacheResult CacheStore::store(const CacheEntry& entry) {
    if (entry.report_file != artifact_name(entry.key)) {
        CacheResult result;
        result.error = {CacheErrorKind::ArtifactWriteFailed,
                        "cache artifact '" + entry.report_file + "' does not match key '" +
                            entry.key + "'"};
        return result;
    }

    index_[entry.key] = entry;
    return save_index();
}

ClearResult CacheStore::clear(const std::optional<std::string>& prefix) {
    ClearResult result;

    std::vector<std::string> doomed;
    for (const auto& kv : index_) {
        // Префикс сравнивается с началом ключа (slug), с учётом регистра
        if (!prefix.has_value() || kv.first.compare(0, prefix->size(), *prefix) == 0) {
            doomed.push_back(kv.first);
        }
    }

    for (const auto& key : doomed) {
        remove_artifact(index_.at(key).report_file);
        index_.erase(key);
    }
    result.removed = doomed.size();

    if (!prefix.has_value()) {
        // Полная очистка: осиротевшие артефакты тоже удаляются
        std::error_code ec;
        if (std::filesystem::is_directory(dir_, ec)) {
            std::filesystem::directory_iterator it(dir_, ec);
            const std::filesystem::directory_iterator end;
            std::vector<std::filesystem::path> orphans;
            while (!ec && it != end) {
                std::string name = platform::path_to_utf8(it->path().filename());
                if (name.rfind("cache_", 0) == 0 && name.size() > 10 &&
                    name.compare(name.size() - 4, 4, ".txt") == 0) {
                    orphans.push_back(it->path());
                }
                it.increment(ec);
            }
            for (const auto& orphan : orphans) {
                remove_artifact(platform::path_to_utf8(orphan.filename()));
            }
        }
    }

    // Без директории и без удалённых записей сохранять нечего
    std::error_code ec;
    if (result.removed == 0 && !std::filesystem::exists(index_path_, ec)) {
        result.ok = true;
        return result;
    }

    CacheResult saved = save_index();
    if (!saved.ok) {
        result.error = saved.error;
        return result;
    }
    result.ok = true;
    return result;
}

std::vector<CacheEntry> CacheStore::list() {
    load_index();

    std::vector<CacheEntry> entries;
    entries.reserve(index_.size());
    for (const auto& kv : index_) {
        entries.push_back(kv.second);
    }
    std::sort(entries.begin(), entries.end(),
              [](const CacheEntry& a, const CacheEntry& b) { return a.key < b.key; });
    return entries;
}

// ----------------------------------------------------------------------------
// Артефакты и директория
// ----------------------------------------------------------------------------

std::filesystem::path CacheStore::artifact_path(const CacheEntry& entry) const {
    return dir_ / platform::path_from_utf8(entry.report_file);
}

CacheResult CacheStore::ensure_directory() {
    CacheResult result;

    std::error_code ec;
    if (std::filesystem::is_directory(dir_, ec)) {
        result.ok = true;
        return result;
    }

    std::filesystem::create_directories(dir_, ec);
    std::error_code check_ec;
    if (ec || !std::filesystem::is_directory(dir_, check_ec)) {
        result.error = {CacheErrorKind::DirectoryUnavailable,
                        "failed to create cache directory '" + platform::path_to_utf8(dir_) +
                            "' - " + (ec ? ec.message() : std::string("not a directory"))};
        return result;
    }

    result.ok = true;
    return result;
}

void CacheStore::remove_artifact(const std::string& file_name) {
    if (!is_plain_file_name(file_name)) {
        warn("ignoring cache artifact outside the cache directory: '" + file_name + "'");
        return;
    }

    std::error_code ec;
    std::filesystem::path path = dir_ / platform::path_from_utf8(file_name);
    std::filesystem::remove(path, ec);
    if (ec) {
        warn("failed to remove cache artifact '" + platform::path_to_utf8(path) + "' - " +
             ec.message());
    }
}

}  // namespace codecollector::cache

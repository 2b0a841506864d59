// ==============================================================================
// discovery.cpp - Поиск файлов проекта
// ==============================================================================
//
// Обход ручной (directory_iterator на каждую директорию), а не
// recursive_directory_iterator: ошибка в одном поддереве не должна
// обрывать весь обход.
//
// ==============================================================================

#include "codecollector/discovery.hpp"

#include "codecollector/platform.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace codecollector::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

void report(const ScanOptions& opt, const std::string& message) {
    if (opt.warn) {
        opt.warn(message);
    }
}

/// Рекурсивно обходит директорию и собирает подходящие файлы
/// Шумовые директории и ссылки на директории не посещаются
void collect_files_recursive(const std::filesystem::path& dir, const std::filesystem::path& base,
                             const PatternSet& patterns, const ScanOptions& opt,
                             ScanResult& result) {
    std::error_code ec;
    std::filesystem::directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);

    if (ec) {
        report(opt, "failed to read directory '" + platform::path_to_utf8(dir) + "' - " +
                        ec.message());
        return;
    }

    const std::filesystem::directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        const std::filesystem::path& entry_path = entry.path();

        std::error_code entry_ec;
        const bool is_link = entry.is_symlink(entry_ec);
        const bool is_dir = !entry_ec && entry.is_directory(entry_ec);

        if (entry_ec) {
            // Файл мог исчезнуть между листингом и stat - не ошибка
            report(opt, "failed to get metadata for '" + platform::path_to_utf8(entry_path) +
                            "' - " + entry_ec.message());
        } else if (is_dir) {
            // Ранняя обрезка: скрытые/шумовые директории не обходятся
            std::string name = platform::path_to_utf8(entry_path.filename());
            if (!is_link && !is_noise_segment(name)) {
                collect_files_recursive(entry_path, base, patterns, opt, result);
            }
        } else if (entry.is_regular_file(entry_ec) && !entry_ec) {
            std::filesystem::path relative = entry_path.lexically_relative(base);
            if (is_eligible(relative, patterns)) {
                result.push_back(entry_path);
            }
        }
        // Сокеты, FIFO, битые ссылки игнорируются

        it.increment(ec);
        if (ec) {
            report(opt, "failed to enter directory '" + platform::path_to_utf8(dir) + "' - " +
                            ec.message());
            // Возвращаем то, что успели собрать
            return;
        }
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::filesystem::path normalize_root(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(root, ec);
    if (ec) {
        abs = root;
    }
    abs = abs.lexically_normal();

    // "/a/b/" -> "/a/b"
    if (!abs.has_filename() && abs.has_relative_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

ScanResult scan(const std::filesystem::path& root, const PatternSet& patterns,
                const ScanOptions& opt) {
    ScanResult result;

    const std::filesystem::path base = normalize_root(root);

    std::error_code ec;
    const bool is_dir = std::filesystem::is_directory(base, ec);
    if (ec || !is_dir) {
        // Пустой результат - не ошибка
        return result;
    }

    collect_files_recursive(base, base, patterns, opt, result);

    // Детерминизм: сортировка по строке пути, затем удаление дубликатов
    std::vector<std::pair<std::string, std::filesystem::path>> keyed;
    keyed.reserve(result.size());
    for (auto& p : result) {
        keyed.emplace_back(platform::generic_utf8(p), std::move(p));
    }
    std::sort(keyed.begin(), keyed.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    keyed.erase(std::unique(keyed.begin(), keyed.end(),
                            [](const auto& a, const auto& b) { return a.first == b.first; }),
                keyed.end());

    result.clear();
    for (auto& kv : keyed) {
        result.push_back(std::move(kv.second));
    }
    return result;
}

}  // namespace codecollector::io

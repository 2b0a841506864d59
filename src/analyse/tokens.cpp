// ==============================================================================
// tokens.cpp - Статистика файлов и оценка токенов
// ==============================================================================
//
// Подсчёт токенов эвристический: пре-токенизация в духе BPE-токенизаторов
// (буквы / цифры по 3 / пунктуация / пробелы), затем оценка числа
// подслов на пре-токен. Точность - порядок величины, не побайтовое
// совпадение с конкретным токенизатором.
//
// ==============================================================================

#include "codecollector/tokens.hpp"

#include "codecollector/platform.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace codecollector::analyse {

namespace {

// Длина куска подслова в схеме Subword
constexpr std::size_t SUBWORD_CHUNK = 6;

// Байт на токен в схеме Bytes
constexpr std::size_t BYTES_PER_TOKEN = 4;

enum class CharClass { Letter, Digit, Space, Punct };

CharClass classify(char ch) {
    auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80 || c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        return CharClass::Letter;
    }
    if (c >= '0' && c <= '9') {
        return CharClass::Digit;
    }
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
        return CharClass::Space;
    }
    return CharClass::Punct;
}

/// Пробел, за которым идёт буква или пунктуация, приклеивается к ним
bool attaches_forward(std::string_view text, std::size_t i) {
    if (text[i] != ' ' || i + 1 >= text.size()) {
        return false;
    }
    CharClass next = classify(text[i + 1]);
    return next == CharClass::Letter || next == CharClass::Punct;
}

std::uint64_t subword_tokens(std::string_view token) {
    if (token.size() > 1 && token.front() == ' ') {
        token.remove_prefix(1);
    }
    switch (classify(token.front())) {
    case CharClass::Letter:
        return (token.size() + SUBWORD_CHUNK - 1) / SUBWORD_CHUNK;
    case CharClass::Digit:
    case CharClass::Space:
    case CharClass::Punct:
    default:
        return 1;
    }
}

std::uint64_t byte_tokens(std::string_view token) {
    return (token.size() + BYTES_PER_TOKEN - 1) / BYTES_PER_TOKEN;
}

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (classify(c) != CharClass::Space) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// Каталог моделей
// ----------------------------------------------------------------------------

const std::vector<ModelLimit>& default_model_catalog() {
    static const std::vector<ModelLimit> catalog = {
        {"GPT-3.5 Turbo", 16385},      {"GPT-4", 8192},
        {"GPT-4 Turbo", 128000},       {"GPT-4o", 128000},
        {"Claude 3.5 Sonnet", 200000}, {"Gemini 1.5 Pro", 2000000},
        {"Llama 3 8B", 8192},          {"Mistral Large", 128000},
    };
    return catalog;
}

std::vector<ContextUsage> context_window_summary(std::uint64_t token_count,
                                                 const std::vector<ModelLimit>& catalog) {
    std::vector<ContextUsage> rows;
    rows.reserve(catalog.size());
    for (const auto& model : catalog) {
        ContextUsage row;
        row.model = model.name;
        row.limit = model.limit;
        row.token_count = token_count;
        row.percentage = model.limit > 0 ? static_cast<double>(token_count) * 100.0 /
                                               static_cast<double>(model.limit)
                                         : 0.0;
        row.exceeded = token_count > model.limit;
        rows.push_back(std::move(row));
    }
    return rows;
}

// ----------------------------------------------------------------------------
// Токены
// ----------------------------------------------------------------------------

std::vector<std::string_view> pretokenize(std::string_view text) {
    std::vector<std::string_view> tokens;

    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t start = i;

        if (attaches_forward(text, i)) {
            ++i;
        }

        switch (classify(text[i])) {
        case CharClass::Letter:
            while (i < text.size() && classify(text[i]) == CharClass::Letter) {
                ++i;
            }
            break;
        case CharClass::Digit: {
            std::size_t n = 0;
            while (i < text.size() && n < 3 && classify(text[i]) == CharClass::Digit) {
                ++i;
                ++n;
            }
            break;
        }
        case CharClass::Space:
            while (i < text.size() && classify(text[i]) == CharClass::Space) {
                // Последний пробел перед словом остаётся следующему токену
                if (i > start && attaches_forward(text, i)) {
                    break;
                }
                ++i;
            }
            break;
        case CharClass::Punct:
        default:
            ++i;
            break;
        }

        tokens.push_back(text.substr(start, i - start));
    }
    return tokens;
}

std::uint64_t count_tokens(std::string_view text, TokenScheme scheme) {
    std::uint64_t total = 0;
    for (std::string_view token : pretokenize(text)) {
        total += (scheme == TokenScheme::Bytes) ? byte_tokens(token) : subword_tokens(token);
    }
    return total;
}

// ----------------------------------------------------------------------------
// FileStats
// ----------------------------------------------------------------------------

FileStats analyze_text(std::string_view text, const std::string& file_path,
                       const std::vector<ModelLimit>& catalog) {
    FileStats stats;
    stats.file_path = file_path;
    stats.file_size = text.size();

    // Кодовые точки: все байты, кроме продолжений 10xxxxxx
    for (char ch : text) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++stats.char_count;
        }
    }

    bool in_word = false;
    for (char ch : text) {
        if (classify(ch) == CharClass::Space) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++stats.word_count;
        }
    }

    stats.token_count = count_tokens(text, TokenScheme::Subword);
    stats.token_count_gpt4 = count_tokens(text, TokenScheme::Bytes);

    // Построчная статистика; завершающий '\n' не открывает новую строку
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t nl = text.find('\n', pos);
        std::size_t end = (nl == std::string_view::npos) ? text.size() : nl;
        std::string_view line = text.substr(pos, end - pos);

        ++stats.line_count;
        if (!is_blank(line)) {
            ++stats.non_empty_line_count;
            if (count_tokens(line, TokenScheme::Subword) < SMALL_LINE_TOKENS) {
                ++stats.small_lines_count;
            }
        }

        if (nl == std::string_view::npos) {
            break;
        }
        pos = nl + 1;
    }

    if (stats.line_count > 0) {
        stats.avg_tokens_per_line =
            static_cast<double>(stats.token_count) / static_cast<double>(stats.line_count);
    }
    if (stats.non_empty_line_count > 0) {
        stats.small_lines_percentage = static_cast<double>(stats.small_lines_count) * 100.0 /
                                       static_cast<double>(stats.non_empty_line_count);
    }

    stats.context = context_window_summary(stats.token_count, catalog);
    return stats;
}

FileStats analyze_file(const std::filesystem::path& path, const std::vector<ModelLimit>& catalog) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        throw std::runtime_error("file not found: " + platform::path_to_utf8(path));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + platform::path_to_utf8(path));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("failed to read file: " + platform::path_to_utf8(path));
    }

    return analyze_text(content, platform::path_to_utf8(path), catalog);
}

}  // namespace codecollector::analyse

// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: никаких std::endl, запись через fwrite.
//
// ==============================================================================

#include "codecollector/output.hpp"

#include "codecollector/platform.hpp"

#include <algorithm>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace codecollector::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg), out_(stdout), err_(stderr) {}

Writer::Writer(const OutputConfig& cfg, FILE* out, FILE* err)
    : config_(cfg),
      out_(out != nullptr ? out : stdout),
      err_(err != nullptr ? err : stderr),
      redirected_(out != nullptr || err != nullptr) {}

Writer::~Writer() {
    flush();
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? out_ : err_;
}

bool Writer::colored(Stream s) const {
    return !redirected_ && supports_color(s);
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr && !bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (colored(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются и при --quiet
    prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    prefixed("[~] ", Color::Magenta, message);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(out_);
    std::fflush(err_);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

void Table::set_align(std::size_t col, Align align) {
    if (col >= align_.size()) {
        align_.resize(col + 1, Align::Left);
    }
    align_[col] = align;
}

std::vector<std::size_t> Table::widths() const {
    std::size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<std::size_t> result(num_cols, 0);
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        result[i] = std::max(result[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            result[i] = std::max(result[i], display_width(row[i]));
        }
    }
    return result;
}

std::string Table::format_line(const std::vector<std::size_t>& widths, const char* left,
                               const char* middle, const char* right) const {
    std::string line = left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        // 1 пробел отступа с каждой стороны
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < widths.size()) ? middle : right;
    }
    return line;
}

std::string Table::format_row(const std::vector<std::size_t>& widths,
                              const std::vector<std::string>& cells) const {
    std::string line = BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = (i < cells.size()) ? cells[i] : std::string();
        const std::size_t pad = widths[i] - display_width(cell);
        const bool right = i < align_.size() && align_[i] == Align::Right;

        line += ' ';
        if (right) {
            line.append(pad, ' ');
        }
        line += cell;
        if (!right) {
            line.append(pad, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    const std::vector<std::size_t> w = widths();
    if (w.empty()) {
        return {};
    }

    std::string result;
    result += format_line(w, BOX_TL, BOX_TT, BOX_TR);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(w, headers_);
        result += '\n';
        result += format_line(w, BOX_LT, BOX_CROSS, BOX_RT);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(w, row);
        result += '\n';
    }

    result += format_line(w, BOX_BL, BOX_BT, BOX_BR);
    result += '\n';
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::size_t display_width(std::string_view text) {
    std::size_t width = 0;
    for (char ch : text) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string format_count(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (i % 3) == lead % 3) {
            result += ',';
        }
        result += digits[i];
    }
    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    return (s == Stream::Stdout) ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace codecollector::output

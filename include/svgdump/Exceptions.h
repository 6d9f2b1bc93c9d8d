#pragma once
#include <stdexcept>
#include <string>

namespace svgdump {

class SvgDumpException : public std::runtime_error {
public:
    SvgDumpException(const std::string& message) : std::runtime_error(message) {}
};

// Неверный аргумент командной строки
class InputException : public SvgDumpException {
public:
    InputException(const std::string& argument, const std::string& reason)
        : SvgDumpException("Invalid argument '" + argument + "': " + reason) {}
};

// Ошибка чтения файла шрифта
class FontLoadException : public SvgDumpException {
public:
    FontLoadException(const std::string& filename, const std::string& reason)
        : SvgDumpException("Failed to load font '" + filename + "': " + reason) {}
};

// Контейнер шрифта повреждён или в нём нет нужной таблицы
class ContainerParseException : public SvgDumpException {
public:
    ContainerParseException(const std::string& reason)
        : SvgDumpException("Font container error: " + reason) {}
};

class TableParseException : public SvgDumpException {
public:
    TableParseException(const std::string& tableTag, const std::string& reason)
        : SvgDumpException("Malformed '" + tableTag + "' table: " + reason) {}
};

class DecompressException : public SvgDumpException {
public:
    DecompressException(const std::string& reason)
        : SvgDumpException("Decompression failed: " + reason) {}
};

class EncodingException : public SvgDumpException {
public:
    EncodingException(const std::string& reason)
        : SvgDumpException("SVG document is not valid UTF-8: " + reason) {}
};

} // namespace svgdump

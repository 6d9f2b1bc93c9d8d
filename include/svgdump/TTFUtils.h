#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <algorithm>
#include <stdexcept>

namespace svgdump {
namespace utils {

/**
 * Невладеющий срез байтов. Владелец буфера (FontFile или кэш
 * распакованных таблиц) должен жить дольше любого ByteSpan.
 */
struct ByteSpan {
    const uint8_t* data = nullptr;
    size_t size = 0;

    ByteSpan() = default;
    ByteSpan(const uint8_t* bytes, size_t length) : data(bytes), size(length) {}
    ByteSpan(const std::vector<uint8_t>& bytes) : data(bytes.data()), size(bytes.size()) {}

    // Подсрез [offset, offset + length); выход за границы -> std::out_of_range
    ByteSpan subspan(size_t offset, size_t length) const {
        if (offset > size || length > size - offset) {
            throw std::out_of_range("Subspan beyond buffer");
        }
        return ByteSpan(data + offset, length);
    }
};

struct TableRecord {
    char tag[4];
    uint32_t checksum;
    uint32_t offset;
    uint32_t length;
};

struct TTFHeader {
    uint32_t sfntVersion;
    uint16_t numTables;
    uint16_t searchRange;
    uint16_t entrySelector;
    uint16_t rangeShift;
};

constexpr size_t kTTFHeaderSize = 12;
constexpr size_t kTableRecordSize = 16;

inline uint32_t makeTag(const char* tag) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(tag[0])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(tag[1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(tag[2])) << 8) |
            static_cast<uint32_t>(static_cast<uint8_t>(tag[3]));
}

// Big-endian чтение из буфера шрифта
class TTFReader {
private:
    ByteSpan data;
    size_t pos;

public:
    TTFReader(const ByteSpan& fontData) : data(fontData), pos(0) {}

    uint16_t readUInt16() {
        if (remaining() < 2) throw std::out_of_range("Read beyond buffer");
        uint16_t value = static_cast<uint16_t>((data.data[pos] << 8) | data.data[pos + 1]);
        pos += 2;
        return value;
    }

    uint32_t readUInt32() {
        if (remaining() < 4) throw std::out_of_range("Read beyond buffer");
        uint32_t value = (static_cast<uint32_t>(data.data[pos]) << 24) |
                         (static_cast<uint32_t>(data.data[pos + 1]) << 16) |
                         (static_cast<uint32_t>(data.data[pos + 2]) << 8) |
                          static_cast<uint32_t>(data.data[pos + 3]);
        pos += 4;
        return value;
    }

    // Позиция равная размеру буфера допустима: дальше читать нельзя
    void seek(size_t newPos) {
        if (newPos > data.size) throw std::out_of_range("Seek beyond buffer");
        pos = newPos;
    }

    void skip(size_t count) {
        if (count > remaining()) throw std::out_of_range("Skip beyond buffer");
        pos += count;
    }

    size_t remaining() const { return data.size - pos; }

    std::string readTag() {
        if (remaining() < 4) throw std::out_of_range("Read beyond buffer");
        std::string result(reinterpret_cast<const char*>(data.data + pos), 4);
        pos += 4;
        return result;
    }

    bool checkTag(const char* tag) const {
        if (remaining() < 4) return false;
        return memcmp(data.data + pos, tag, 4) == 0;
    }
};

// Big-endian запись, используется для сборки тестовых шрифтов
class TTFWriter {
private:
    std::vector<uint8_t> data;
    size_t pos;

public:
    TTFWriter() : pos(0) {}

    void writeUInt16(uint16_t value) {
        if (pos + 2 > data.size()) data.resize(pos + 2);
        data[pos] = (value >> 8) & 0xFF;
        data[pos + 1] = value & 0xFF;
        pos += 2;
    }

    void writeUInt32(uint32_t value) {
        if (pos + 4 > data.size()) data.resize(pos + 4);
        data[pos] = (value >> 24) & 0xFF;
        data[pos + 1] = (value >> 16) & 0xFF;
        data[pos + 2] = (value >> 8) & 0xFF;
        data[pos + 3] = value & 0xFF;
        pos += 4;
    }

    void writeTag(const char* tag) {
        writeUInt32(makeTag(tag));
    }

    void writeBytes(const std::vector<uint8_t>& bytes) {
        if (pos + bytes.size() > data.size()) data.resize(pos + bytes.size());
        std::copy(bytes.begin(), bytes.end(), data.begin() + pos);
        pos += bytes.size();
    }

    void seek(size_t newPos) {
        if (newPos > data.size()) data.resize(newPos);
        pos = newPos;
    }

    size_t getPosition() const { return pos; }
    const std::vector<uint8_t>& getData() const { return data; }
};

/**
 * Разбор каталога таблиц SFNT, начинающегося с directoryOffset.
 * Для TTC каталог лежит не в начале файла, но смещения таблиц
 * всё равно считаются от начала файла.
 */
std::vector<TableRecord> parseTTFTables(const ByteSpan& fontData, size_t directoryOffset = 0);
bool hasTable(const std::vector<TableRecord>& tables, const std::string& tableTag);
const TableRecord* findTable(const std::vector<TableRecord>& tables, const std::string& tableTag);

}
}

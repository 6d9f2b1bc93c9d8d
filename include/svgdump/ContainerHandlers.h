#pragma once
#include <map>
#include <string>
#include <vector>

#include "svgdump/SvgDump.h"

namespace svgdump {

/**
 * Таблицы одного начертания sfnt. Для TTC каталог начинается
 * со смещения начертания внутри коллекции.
 */
class SFNT_TableProvider : public FontTableProvider {
public:
    SFNT_TableProvider(const utils::ByteSpan& fontData, size_t directoryOffset,
                       ContainerFormat format);

    ContainerFormat getFormat() const override { return format; }
    bool hasTable(const std::string& tag) const override;
    utils::ByteSpan readTableData(const std::string& tag) override;

private:
    utils::ByteSpan fontData;
    ContainerFormat format;
    std::vector<utils::TableRecord> tables;
};

class SFNT_Handler : public ContainerHandler {
public:
    bool canHandle(const utils::ByteSpan& fontData) const override;
    std::unique_ptr<FontTableProvider> open(const utils::ByteSpan& fontData,
                                            uint32_t faceIndex) const override;
    ContainerFormat getFormat() const override { return ContainerFormat::OPENTYPE; }
};

class TTC_Handler : public ContainerHandler {
public:
    bool canHandle(const utils::ByteSpan& fontData) const override;
    std::unique_ptr<FontTableProvider> open(const utils::ByteSpan& fontData,
                                            uint32_t faceIndex) const override;
    ContainerFormat getFormat() const override { return ContainerFormat::TRUETYPE_COLLECTION; }

    // Смещения каталогов всех начертаний коллекции
    static std::vector<uint32_t> readFaceOffsets(const utils::ByteSpan& fontData);
};

struct WOFFTableEntry {
    char tag[4];
    uint32_t offset;
    uint32_t compLength;
    uint32_t origLength;
    uint32_t origChecksum;
};

/**
 * Таблицы WOFF 1.0. Сжатые zlib таблицы распаковываются при первом
 * обращении и хранятся в провайдере до его уничтожения.
 */
class WOFF_TableProvider : public FontTableProvider {
public:
    explicit WOFF_TableProvider(const utils::ByteSpan& fontData);

    ContainerFormat getFormat() const override { return ContainerFormat::WOFF; }
    bool hasTable(const std::string& tag) const override;
    utils::ByteSpan readTableData(const std::string& tag) override;

private:
    utils::ByteSpan fontData;
    uint32_t flavor;
    std::vector<WOFFTableEntry> entries;
    std::map<std::string, std::vector<uint8_t>> inflatedTables;

    const WOFFTableEntry* findEntry(const std::string& tag) const;
};

class WOFF_Handler : public ContainerHandler {
public:
    static constexpr size_t kHeaderSize = 44;
    static constexpr size_t kEntrySize = 20;

    bool canHandle(const utils::ByteSpan& fontData) const override;
    std::unique_ptr<FontTableProvider> open(const utils::ByteSpan& fontData,
                                            uint32_t faceIndex) const override;
    ContainerFormat getFormat() const override { return ContainerFormat::WOFF; }
};

} // namespace svgdump

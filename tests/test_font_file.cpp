#undef NDEBUG
#include "svgdump/FontFile.h"
#include "svgdump/ContainerHandlers.h"
#include "svgdump/ContainerRegistry.h"
#include "svgdump/SVGTable.h"
#include "TestFonts.h"
#include <cassert>
#include <cstring>
#include <iostream>

using namespace testfonts;

void testOpenTypeTableLookup() {
    std::cout << "Testing OpenType table lookup..." << std::endl;

    Bytes svgTable = buildSvgTable({{1, 1, bytesOf("<svg/>")}});
    svgdump::FontFile font(buildSfnt({{"head", Bytes(54, 7)}, {"SVG ", svgTable}}), "mem.ttf");
    assert(font.getFormat() == svgdump::ContainerFormat::OPENTYPE);

    auto provider = font.tableProvider(0);
    assert(provider->hasTable("SVG "));
    assert(provider->hasTable("head"));
    assert(!provider->hasTable("CBDT"));

    // Срез указывает прямо в буфер файла, без копирования
    svgdump::utils::ByteSpan svg = provider->readTableData("SVG ");
    assert(svg.size == svgTable.size());
    assert(svg.data >= font.data().data());
    assert(svg.data + svg.size <= font.data().data() + font.data().size());
    assert(memcmp(svg.data, svgTable.data(), svgTable.size()) == 0);

    std::cout << "✓ OpenType table lookup test passed" << std::endl;
}

void testCffFlavourAccepted() {
    std::cout << "Testing OTTO flavour..." << std::endl;

    Bytes data = buildSfnt({{"SVG ", buildSvgTable({})}}, svgdump::utils::makeTag("OTTO"));
    svgdump::FontFile font(data, "mem.otf");
    assert(font.getFormat() == svgdump::ContainerFormat::OPENTYPE);
    assert(font.tableProvider(0)->readTableData("SVG ").size == 12);

    std::cout << "✓ OTTO flavour test passed" << std::endl;
}

void testMissingTable() {
    std::cout << "Testing missing SVG table..." << std::endl;

    svgdump::FontFile font(buildSfnt({{"head", Bytes(54, 0)}}), "mem.ttf");
    auto provider = font.tableProvider(0);
    assert(throwsException<svgdump::ContainerParseException>([&] {
        provider->readTableData("SVG ");
    }));

    std::cout << "✓ Missing SVG table test passed" << std::endl;
}

void testTableBeyondEndOfFile() {
    std::cout << "Testing table extent past end of file..." << std::endl;

    Bytes data = buildSfnt({{"SVG ", buildSvgTable({{1, 1, bytesOf("<svg/>")}})}});
    // Длина записи каталога больше, чем осталось в файле
    svgdump::utils::TTFWriter w;
    w.writeBytes(data);
    w.seek(12 + 12);
    w.writeUInt32(static_cast<uint32_t>(data.size()));

    svgdump::FontFile font(w.getData(), "mem.ttf");
    auto provider = font.tableProvider(0);
    assert(provider->hasTable("SVG "));
    assert(throwsException<svgdump::ContainerParseException>([&] {
        provider->readTableData("SVG ");
    }));

    std::cout << "✓ Table extent test passed" << std::endl;
}

void testTruncatedDirectory() {
    std::cout << "Testing truncated table directory..." << std::endl;

    Bytes data = buildSfnt({{"head", Bytes(4, 0)}, {"SVG ", Bytes(12, 0)}});
    data.resize(20);
    svgdump::FontFile font(data, "mem.ttf");
    assert(throwsException<svgdump::ContainerParseException>([&] { font.tableProvider(0); }));

    std::cout << "✓ Truncated table directory test passed" << std::endl;
}

void testCollectionFaces() {
    std::cout << "Testing TrueType collection..." << std::endl;

    Bytes first = buildSvgTable({{1, 1, bytesOf("<svg id='a'/>")}});
    Bytes second = buildSvgTable({{2, 3, bytesOf("<svg id='b'/>")}, {4, 4, bytesOf("<svg/>")}});
    svgdump::FontFile font(buildTtc({
        {{"head", Bytes(54, 0)}, {"SVG ", first}},
        {{"SVG ", second}},
    }), "mem.ttc");
    assert(font.getFormat() == svgdump::ContainerFormat::TRUETYPE_COLLECTION);

    std::vector<uint32_t> offsets = svgdump::TTC_Handler::readFaceOffsets(font.data());
    assert(offsets.size() == 2);

    auto face0 = font.tableProvider(0);
    assert(face0->getFormat() == svgdump::ContainerFormat::TRUETYPE_COLLECTION);
    assert(svgdump::SvgTable(face0->readTableData("SVG ")).numRecords() == 1);

    auto face1 = font.tableProvider(1);
    assert(!face1->hasTable("head"));
    svgdump::utils::ByteSpan svg = face1->readTableData("SVG ");
    assert(svg.size == second.size());
    assert(svgdump::SvgTable(svg).numRecords() == 2);

    assert(throwsException<svgdump::ContainerParseException>([&] { font.tableProvider(2); }));

    std::cout << "✓ TrueType collection test passed" << std::endl;
}

void testFaceIndexOnSingleFont() {
    std::cout << "Testing face index on a single font..." << std::endl;

    svgdump::FontFile font(buildSvgFont({}), "mem.ttf");
    assert(throwsException<svgdump::ContainerParseException>([&] { font.tableProvider(1); }));

    std::cout << "✓ Face index test passed" << std::endl;
}

void testWoffTables() {
    std::cout << "Testing WOFF tables..." << std::endl;

    std::string longDocument = "<svg xmlns='http://www.w3.org/2000/svg'>";
    for (int i = 0; i < 50; ++i) {
        longDocument += "<rect x='0' y='0' width='10' height='10'/>";
    }
    longDocument += "</svg>";
    Bytes svgTable = buildSvgTable({{5, 9, bytesOf(longDocument)}});

    for (bool compress : {false, true}) {
        svgdump::FontFile font(buildWoff({{"head", Bytes(54, 0)}, {"SVG ", svgTable}}, compress), "mem.woff");
        assert(font.getFormat() == svgdump::ContainerFormat::WOFF);

        auto provider = font.tableProvider(0);
        svgdump::utils::ByteSpan svg = provider->readTableData("SVG ");
        assert(svg.size == svgTable.size());
        assert(memcmp(svg.data, svgTable.data(), svgTable.size()) == 0);

        // Повторный запрос отдаёт тот же распакованный буфер
        svgdump::utils::ByteSpan again = provider->readTableData("SVG ");
        assert(again.data == svg.data);

        assert(throwsException<svgdump::ContainerParseException>([&] { provider->readTableData("CBDT"); }));
        assert(throwsException<svgdump::ContainerParseException>([&] { font.tableProvider(1); }));
    }

    std::cout << "✓ WOFF tables test passed" << std::endl;
}

void testCorruptWoffTable() {
    std::cout << "Testing corrupt WOFF table..." << std::endl;

    Bytes svgTable(200, 'x');
    Bytes data = buildWoff({{"SVG ", svgTable}}, true);
    // Портим сжатые данные сразу за заголовком zlib
    size_t tableOffset = 44 + 20;
    for (size_t i = tableOffset + 2; i < data.size(); ++i) {
        data[i] = 0xFF;
    }

    svgdump::FontFile font(data, "mem.woff");
    auto provider = font.tableProvider(0);
    assert(throwsException<svgdump::ContainerParseException>([&] { provider->readTableData("SVG "); }));

    std::cout << "✓ Corrupt WOFF table test passed" << std::endl;
}

void testUnknownContainer() {
    std::cout << "Testing unknown container..." << std::endl;

    svgdump::FontFile empty(Bytes(), "empty.ttf");
    assert(empty.getFormat() == svgdump::ContainerFormat::UNKNOWN);
    assert(throwsException<svgdump::ContainerParseException>([&] { empty.tableProvider(0); }));

    svgdump::FontFile woff2(bytesOf("wOF2 pretend this is a woff2 font"), "font.woff2");
    assert(woff2.getFormat() == svgdump::ContainerFormat::UNKNOWN);
    assert(throwsException<svgdump::ContainerParseException>([&] { woff2.tableProvider(0); }));

    assert(svgdump::ContainerRegistry::instance().getSupportedFormats().size() == 3);

    std::cout << "✓ Unknown container test passed" << std::endl;
}

void testLoadFromDisk() {
    std::cout << "Testing font loading from disk..." << std::endl;

    Bytes data = buildSvgFont({{3, 4, bytesOf("<svg/>")}});
    writeFile("test_font_file.ttf", data);

    svgdump::FontFile font("test_font_file.ttf");
    assert(font.data() == data);
    assert(font.getPath() == "test_font_file.ttf");

    assert(throwsException<svgdump::FontLoadException>([] {
        svgdump::FontFile missing("does/not/exist.ttf");
    }));

    std::cout << "✓ Font loading test passed" << std::endl;
}

int main() {
    try {
        testOpenTypeTableLookup();
        testCffFlavourAccepted();
        testMissingTable();
        testTableBeyondEndOfFile();
        testTruncatedDirectory();
        testCollectionFaces();
        testFaceIndexOnSingleFont();
        testWoffTables();
        testCorruptWoffTable();
        testUnknownContainer();
        testLoadFromDisk();
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

#undef NDEBUG
#include "svgdump/Digest.h"
#include "TestFonts.h"
#include <cassert>
#include <iostream>

using namespace testfonts;

void testKnownVectors() {
    std::cout << "Testing SHA-256 known vectors..." << std::endl;

    assert(svgdump::utils::sha256Hex(Bytes()) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(svgdump::utils::sha256Hex(bytesOf("abc")) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(svgdump::utils::sha256Hex(bytesOf("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
           "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    std::cout << "✓ SHA-256 known vectors test passed" << std::endl;
}

void testFinalizeResetsState() {
    std::cout << "Testing digest reset between messages..." << std::endl;

    svgdump::utils::Sha256 hasher;
    hasher.update(bytesOf("first document"));
    std::vector<uint8_t> first = hasher.finalizeReset();
    assert(first.size() == svgdump::utils::Sha256::kDigestLength);

    // Второй дайджест не зависит от первого сообщения
    hasher.update(bytesOf("abc"));
    assert(svgdump::utils::toHexLower(hasher.finalizeReset()) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    hasher.update(bytesOf("first document"));
    assert(hasher.finalizeReset() == first);

    // Обновление по частям равно обновлению целиком
    hasher.update(bytesOf("a"));
    hasher.update(bytesOf("bc"));
    assert(svgdump::utils::toHexLower(hasher.finalizeReset()) == svgdump::utils::sha256Hex(bytesOf("abc")));

    std::cout << "✓ Digest reset test passed" << std::endl;
}

void testHexKeepsLeadingZeros() {
    std::cout << "Testing hex encoding..." << std::endl;

    assert(svgdump::utils::toHexLower(std::vector<uint8_t>{0x00, 0x0F, 0xA0, 0xFF}) == "000fa0ff");
    assert(svgdump::utils::toHexLower(std::vector<uint8_t>()).empty());
    assert(svgdump::utils::sha256Hex(bytesOf("<svg/>")).size() == 64);

    std::cout << "✓ Hex encoding test passed" << std::endl;
}

int main() {
    try {
        testKnownVectors();
        testFinalizeResetsState();
        testHexKeepsLeadingZeros();
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

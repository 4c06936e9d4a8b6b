#include <iostream>
#include <vector>
#include <numeric>

#include "test_utils.hpp"
#include "ScsPacket.hpp"

void test_wire_layout() {
    std::cout << "\n--- TEST: Wire Layout ---" << std::endl;
    ScsPacket p(7, 0x11223344u, std::vector<uint8_t>{0xAA, 0xBB});
    std::vector<uint8_t> bytes = p.encode();

    ASSERT_TRUE(bytes.size() == SCS_UDP_META_SIZE + 2, "Encoded size is header + payload");
    ASSERT_TRUE(bytes[0] == 7, "Byte 0 is the index");
    ASSERT_TRUE(bytes[1] == 0x44 && bytes[2] == 0x33 && bytes[3] == 0x22 && bytes[4] == 0x11,
                "Frame id is little-endian");
    ASSERT_TRUE(bytes[5] == 0xAA && bytes[6] == 0xBB, "Payload follows the header");
}

void test_round_trip_bounds() {
    std::cout << "\n--- TEST: Round Trip At The Bounds ---" << std::endl;
    std::vector<uint8_t> payload(SCS_UDP_MAX_PAYLOAD);
    std::iota(payload.begin(), payload.end(), 0);

    ScsPacket full(255, 0xFFFFFFFFu, payload);
    ScsPacket back = ScsPacket::decode(full.encode());
    ASSERT_TRUE(back == full, "Max index and max frame id survive");
    ASSERT_TRUE(back.payload == payload, "Full payload survives");
    ASSERT_TRUE(!back.is_terminator(), "Full-size fragment is not a terminator");

    ScsPacket empty(0, 0, std::vector<uint8_t>());
    ScsPacket back_empty = ScsPacket::decode(empty.encode());
    ASSERT_TRUE(back_empty == empty && back_empty.payload.empty(), "Header-only fragment survives");
    ASSERT_TRUE(back_empty.is_terminator(), "Empty fragment is a terminator");
}

void test_short_decode() {
    std::cout << "\n--- TEST: Short Buffer ---" << std::endl;
    uint8_t buf[SCS_UDP_META_SIZE] = {1, 2, 3, 4, 5};

    for (size_t n = 0; n < SCS_UDP_META_SIZE; ++n) {
        bool thrown = false;
        try {
            ScsPacket::decode(buf, n);
        } catch (const MalformedPacket&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "Decode of " << n << " bytes throws MalformedPacket");
    }
    ScsPacket p = ScsPacket::decode(buf, SCS_UDP_META_SIZE);
    ASSERT_TRUE(p.index == 1 && p.frame_id == 0x05040302u, "Exactly META_SIZE bytes decodes");
}

void test_equality_and_order() {
    std::cout << "\n--- TEST: Equality And Ordering ---" << std::endl;
    ScsPacket a(3, 10, std::vector<uint8_t>(5, 1));
    ScsPacket b(3, 10, std::vector<uint8_t>(9, 2));
    ScsPacket c(4, 10, std::vector<uint8_t>(5, 1));
    ScsPacket other(3, 11, std::vector<uint8_t>(5, 1));

    ASSERT_TRUE(a == b, "Payload does not take part in equality");
    ASSERT_TRUE(a != c, "Index does");
    ASSERT_TRUE(a != other, "Frame id does");
    ASSERT_TRUE(a < c && !(c < a), "Packets order by index within a frame");

    bool thrown = false;
    try {
        (void)(a < other);
    } catch (const std::logic_error&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown, "Ordering across frames is rejected");
}

int main() {

    test_wire_layout();
    test_round_trip_bounds();
    test_short_decode();
    test_equality_and_order();

    std::cout << "\n[ALL TESTS PASSED]" << std::endl;
    return 0;
}

#include "unity.h"
#include "mbus/MBusFrames.hxx"
#include "mbus/MBusDataRecords.hxx"

using namespace mbusMQTT;

static void test_short_frame_layout() {
    const auto frame = Frames::Factory::RequestData(5);
    TEST_ASSERT_EQUAL_size_t(5, frame.size());
    TEST_ASSERT_EQUAL_HEX8(0x10, frame[0]);
    TEST_ASSERT_EQUAL_HEX8(0x5B, frame[1]);
    TEST_ASSERT_EQUAL_HEX8(0x05, frame[2]);
    TEST_ASSERT_EQUAL_HEX8(0x60, frame[3]);
    TEST_ASSERT_EQUAL_HEX8(0x16, frame[4]);
    TEST_ASSERT_EQUAL(Frames::ReplyKind::Short, Frames::classify(frame));
}

static void test_select_frame_encodes_mask() {
    const auto frame = Frames::Factory::SelectSecondary("12345678FFFFFFFF");
    TEST_ASSERT_TRUE(frame.has_value());

    Frames::LongFrame decoded;
    TEST_ASSERT_EQUAL(Frames::DecodeStatus::Ok, Frames::decodeLong(*frame, decoded));
    TEST_ASSERT_EQUAL_HEX8(0x53, decoded.control);
    TEST_ASSERT_EQUAL_HEX8(0xFD, decoded.address);
    TEST_ASSERT_EQUAL_HEX8(0x52, decoded.control_info);
    TEST_ASSERT_EQUAL_size_t(8, decoded.data.size());
    // Identification is sent LSB first
    TEST_ASSERT_EQUAL_HEX8(0x78, decoded.data[0]);
    TEST_ASSERT_EQUAL_HEX8(0x12, decoded.data[3]);
    TEST_ASSERT_EQUAL_STRING("12345678FFFFFFFF", Frames::decodeSecondaryMask(decoded.data).c_str());

    TEST_ASSERT_FALSE(Frames::Factory::SelectSecondary("1234").has_value());
    TEST_ASSERT_FALSE(Frames::Factory::SelectSecondary("1234567XFFFFFFFF").has_value());
}

static void test_classify_replies() {
    const std::vector<uint8_t> ack = {0xE5};
    TEST_ASSERT_EQUAL(Frames::ReplyKind::Ack, Frames::classify(ack));
    TEST_ASSERT_EQUAL(Frames::ReplyKind::None, Frames::classify(std::vector<uint8_t>{}));

    const std::vector<uint8_t> data = {0x01, 0x02};
    auto frame = Frames::Factory::Long(0x08, 1, 0x72, data);
    TEST_ASSERT_EQUAL(Frames::ReplyKind::Long, Frames::classify(frame));

    frame[frame.size() - 2] ^= 0xFF;
    TEST_ASSERT_EQUAL(Frames::ReplyKind::Invalid, Frames::classify(frame));

    const std::vector<uint8_t> two_acks = {0xE5, 0xE5};
    TEST_ASSERT_EQUAL(Frames::ReplyKind::Invalid, Frames::classify(two_acks));
}

static void test_expected_length() {
    TEST_ASSERT_EQUAL_INT(1, Frames::expectedLength(std::vector<uint8_t>{0xE5}));
    TEST_ASSERT_EQUAL_INT(5, Frames::expectedLength(std::vector<uint8_t>{0x10}));
    TEST_ASSERT_EQUAL_INT(0, Frames::expectedLength(std::vector<uint8_t>{0x68, 0x10}));
    TEST_ASSERT_EQUAL_INT(0x10 + 6, Frames::expectedLength(std::vector<uint8_t>{0x68, 0x10, 0x10}));
    TEST_ASSERT_EQUAL_INT(-1, Frames::expectedLength(std::vector<uint8_t>{0x68, 0x10, 0x11}));
    TEST_ASSERT_EQUAL_INT(-1, Frames::expectedLength(std::vector<uint8_t>{0x42}));
}

static void test_mask_matching() {
    TEST_ASSERT_TRUE(Frames::maskMatches("1FFFFFFFFFFFFFFF", "123456782C2D0107"));
    TEST_ASSERT_TRUE(Frames::maskMatches("12345678FFFFFFFF", "123456782c2d0107"));
    TEST_ASSERT_FALSE(Frames::maskMatches("2FFFFFFFFFFFFFFF", "123456782C2D0107"));
    TEST_ASSERT_FALSE(Frames::maskMatches("1FFF", "123456782C2D0107"));
}

static void test_header_and_records_decode() {
    DataRecords::VariableDataHeader header;
    header.identification = "12345678";
    header.manufacturer_code = 0x2C2D;
    header.version = 1;
    header.medium = 0x07;

    std::vector<uint8_t> payload = DataRecords::encodeHeader(header);
    const std::vector<uint8_t> records = {
        0x04, 0x03, 0x39, 0x30, 0x00, 0x00,     // Energy 12345 Wh
        0x02, 0x59, 0x8F, 0x19,                 // Flow temperature 65.43
        0x0C, 0x78, 0x78, 0x56, 0x34, 0x12      // Fabrication number, BCD
    };
    payload.insert(payload.end(), records.begin(), records.end());

    const auto raw = Frames::Factory::Long(0x08, 0, 0x72, payload);
    Frames::LongFrame frame;
    TEST_ASSERT_EQUAL(Frames::ReplyKind::Long, Frames::classify(raw, &frame));

    const auto data = DataRecords::decode(frame);
    TEST_ASSERT_TRUE(data.has_value());
    TEST_ASSERT_EQUAL_STRING("123456782C2D0107", DataRecords::secondaryAddress(data->header).c_str());
    TEST_ASSERT_EQUAL_STRING("KAM", DataRecords::manufacturerToString(data->header.manufacturer_code).c_str());
    TEST_ASSERT_EQUAL_STRING("Water", DataRecords::mediumToString(data->header.medium));

    TEST_ASSERT_EQUAL_size_t(3, data->records.size());
    TEST_ASSERT_EQUAL_STRING("Energy (kWh)", data->records[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("12.345", recordValueToString(data->records[0].value).c_str());
    TEST_ASSERT_EQUAL_STRING("instantaneous", data->records[0].function_code.c_str());
    TEST_ASSERT_EQUAL_STRING("Flow Temperature (°C)", data->records[1].name.c_str());
    TEST_ASSERT_EQUAL_STRING("65.43", recordValueToString(data->records[1].value).c_str());
    TEST_ASSERT_EQUAL_STRING("Fabrication No", data->records[2].name.c_str());
    TEST_ASSERT_EQUAL_STRING("12345678", recordValueToString(data->records[2].value).c_str());
}

static void test_invalid_bcd_keeps_record_types() {
    DataRecords::VariableDataHeader header;
    header.identification = "12345678";
    std::vector<uint8_t> payload = DataRecords::encodeHeader(header);
    payload.insert(payload.end(), {
        0x0C, 0x13, 0xAB, 0x00, 0x00, 0x00,     // Volume, BCD with a non-decimal nibble
        0x04, 0x03, 0x39, 0x30, 0x00, 0x00,     // Energy 12345 Wh
        0x0C, 0x78, 0x7A, 0x56, 0x34, 0x12      // Fabrication number, same defect
    });

    const auto data = DataRecords::decode(Frames::LongFrame{0x08, 0, 0x72, payload});
    TEST_ASSERT_TRUE(data.has_value());
    // The numeric record is left out of this read instead of turning into text
    TEST_ASSERT_EQUAL_size_t(2, data->records.size());
    TEST_ASSERT_EQUAL_STRING("Energy (kWh)", data->records[0].name.c_str());
    TEST_ASSERT_TRUE(std::holds_alternative<double>(data->records[0].value));
    TEST_ASSERT_EQUAL_STRING("Fabrication No", data->records[1].name.c_str());
    TEST_ASSERT_TRUE(std::holds_alternative<std::string>(data->records[1].value));
    TEST_ASSERT_EQUAL_STRING("1234567A", recordValueToString(data->records[1].value).c_str());
}

static void test_truncated_record_is_rejected() {
    DataRecords::VariableDataHeader header;
    header.identification = "00000001";
    std::vector<uint8_t> payload = DataRecords::encodeHeader(header);
    payload.insert(payload.end(), {0x04, 0x03, 0x39});

    Frames::LongFrame frame{0x08, 0, 0x72, payload};
    TEST_ASSERT_FALSE(DataRecords::decode(frame).has_value());

    frame.control_info = 0x73;
    TEST_ASSERT_FALSE(DataRecords::decode(frame).has_value());
}

static void test_address_parsing() {
    auto primary = MBusAddress::parse("5");
    TEST_ASSERT_TRUE(primary.has_value());
    TEST_ASSERT_TRUE(primary->isPrimary());
    TEST_ASSERT_EQUAL_UINT8(5, primary->primary);

    auto secondary = MBusAddress::parse("123456782c2d0107");
    TEST_ASSERT_TRUE(secondary.has_value());
    TEST_ASSERT_FALSE(secondary->isPrimary());
    TEST_ASSERT_EQUAL_STRING("123456782C2D0107", secondary->secondary.c_str());
    TEST_ASSERT_EQUAL_STRING("mbus_meter_123456782c2d0107", makeDeviceId(*secondary).c_str());

    TEST_ASSERT_FALSE(MBusAddress::parse("251").has_value());
    TEST_ASSERT_FALSE(MBusAddress::parse("meter").has_value());
}

void run_mbus_frames_tests() {
    RUN_TEST(test_short_frame_layout);
    RUN_TEST(test_select_frame_encodes_mask);
    RUN_TEST(test_classify_replies);
    RUN_TEST(test_expected_length);
    RUN_TEST(test_mask_matching);
    RUN_TEST(test_header_and_records_decode);
    RUN_TEST(test_invalid_bcd_keeps_record_types);
    RUN_TEST(test_truncated_record_is_rejected);
    RUN_TEST(test_address_parsing);
}

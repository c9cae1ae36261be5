#include <unity.h>

#include <string>

#include "Modules/Stores/CacheModule/RespCodec.h"

void setUp() {}
void tearDown() {}

/// Serves bytes from a fixed buffer.
class StringRespReader : public RespReader {
public:
    explicit StringRespReader(const std::string& data) : data_(data) {}

    bool readLine(std::string& line) override
    {
        const size_t end = data_.find("\r\n", pos_);
        if (end == std::string::npos) return false;
        line = data_.substr(pos_, end - pos_);
        pos_ = end + 2;
        return true;
    }

    bool readExact(size_t n, std::string& out) override
    {
        if (pos_ + n > data_.size()) return false;
        out = data_.substr(pos_, n);
        pos_ += n;
        return true;
    }

private:
    std::string data_;
    size_t pos_ = 0;
};

static bool parse(const std::string& wire, RespReply& out)
{
    StringRespReader in(wire);
    return respParseReply(in, out);
}

void test_encode_command()
{
    std::string out;
    respEncodeCommand({"SET", "irriflow:pump:state", "{\"is_on\":true}"}, out);
    TEST_ASSERT_EQUAL_STRING(
        "*3\r\n$3\r\nSET\r\n$19\r\nirriflow:pump:state\r\n$14\r\n{\"is_on\":true}\r\n",
        out.c_str());
}

void test_encode_empty_argument()
{
    std::string out;
    respEncodeCommand({"GET", ""}, out);
    TEST_ASSERT_EQUAL_STRING("*2\r\n$3\r\nGET\r\n$0\r\n\r\n", out.c_str());
}

void test_parse_status_and_error()
{
    RespReply r;
    TEST_ASSERT_TRUE(parse("+OK\r\n", r));
    TEST_ASSERT_TRUE(r.isOk());

    TEST_ASSERT_TRUE(parse("-WRONGTYPE Operation against a key\r\n", r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RespReply::Type::Error, (uint8_t)r.type);
    TEST_ASSERT_EQUAL_STRING("WRONGTYPE Operation against a key", r.str.c_str());
    TEST_ASSERT_FALSE(r.isOk());
}

void test_parse_integer()
{
    RespReply r;
    TEST_ASSERT_TRUE(parse(":42\r\n", r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RespReply::Type::Integer, (uint8_t)r.type);
    TEST_ASSERT_EQUAL_INT(42, (int)r.integer);

    TEST_ASSERT_FALSE(parse(":4x\r\n", r));
}

void test_parse_bulk_and_nil()
{
    RespReply r;
    TEST_ASSERT_TRUE(parse("$5\r\nhello\r\n", r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RespReply::Type::Bulk, (uint8_t)r.type);
    TEST_ASSERT_EQUAL_STRING("hello", r.str.c_str());

    // Payload containing CRLF is read by length.
    TEST_ASSERT_TRUE(parse("$4\r\na\r\nb\r\n", r));
    TEST_ASSERT_EQUAL_UINT32(4, (uint32_t)r.str.size());

    TEST_ASSERT_TRUE(parse("$-1\r\n", r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RespReply::Type::Nil, (uint8_t)r.type);
}

void test_parse_bulk_missing_terminator_fails()
{
    RespReply r;
    TEST_ASSERT_FALSE(parse("$5\r\nhelloXY", r));
    TEST_ASSERT_FALSE(parse("$5\r\nhel", r));
}

void test_parse_array()
{
    RespReply r;
    TEST_ASSERT_TRUE(parse("*3\r\n$1\r\na\r\n:7\r\n$-1\r\n", r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RespReply::Type::Array, (uint8_t)r.type);
    TEST_ASSERT_EQUAL_UINT32(3, (uint32_t)r.elements.size());
    TEST_ASSERT_EQUAL_STRING("a", r.elements[0].str.c_str());
    TEST_ASSERT_EQUAL_INT(7, (int)r.elements[1].integer);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RespReply::Type::Nil, (uint8_t)r.elements[2].type);

    TEST_ASSERT_TRUE(parse("*0\r\n", r));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)r.elements.size());
}

void test_parse_rejects_deep_nesting()
{
    std::string wire;
    for (int i = 0; i < RESP_MAX_DEPTH + 2; ++i) wire += "*1\r\n";
    wire += ":1\r\n";
    RespReply r;
    TEST_ASSERT_FALSE(parse(wire, r));
}

void test_parse_rejects_oversized_array_header()
{
    RespReply r;
    TEST_ASSERT_FALSE(parse("*9999999999\r\n", r));
    TEST_ASSERT_FALSE(parse("*65537\r\n", r));

    // At the cap the header is accepted; the body is still required.
    TEST_ASSERT_FALSE(parse("*65536\r\n:1\r\n", r));
}

void test_parse_unknown_prefix_fails()
{
    RespReply r;
    TEST_ASSERT_FALSE(parse("?what\r\n", r));
    TEST_ASSERT_FALSE(parse("", r));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_encode_command);
    RUN_TEST(test_encode_empty_argument);
    RUN_TEST(test_parse_status_and_error);
    RUN_TEST(test_parse_integer);
    RUN_TEST(test_parse_bulk_and_nil);
    RUN_TEST(test_parse_bulk_missing_terminator_fails);
    RUN_TEST(test_parse_array);
    RUN_TEST(test_parse_rejects_deep_nesting);
    RUN_TEST(test_parse_rejects_oversized_array_header);
    RUN_TEST(test_parse_unknown_prefix_fails);
    return UNITY_END();
}

#pragma once
/**
 * @file RespCodec.h
 * @brief RESP (Redis Serialization Protocol) command encoder and reply parser.
 */
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/** @brief Parsed RESP reply. */
struct RespReply {
    enum class Type : uint8_t { Nil, Status, Error, Integer, Bulk, Array };

    Type type = Type::Nil;
    std::string str;              ///< Status, Error, Bulk
    long long integer = 0;        ///< Integer
    std::vector<RespReply> elements;  ///< Array

    bool isOk() const { return type == Type::Status && str == "OK"; }
};

/**
 * @brief Byte source the parser pulls from (socket or buffer).
 */
class RespReader {
public:
    virtual ~RespReader() = default;
    /** @brief Read one CRLF-terminated line, CRLF stripped. */
    virtual bool readLine(std::string& line) = 0;
    /** @brief Read exactly n bytes. */
    virtual bool readExact(size_t n, std::string& out) = 0;
};

/** @brief Maximum nesting accepted by `respParseReply`. */
constexpr uint8_t RESP_MAX_DEPTH = 4;
/** @brief Largest bulk string accepted (bytes). */
constexpr long long RESP_MAX_BULK = 8 * 1024 * 1024;
/** @brief Largest array reply accepted (elements). */
constexpr long long RESP_MAX_ARRAY = 65536;

/** @brief Encode a command as a RESP array of bulk strings. */
void respEncodeCommand(const std::vector<std::string>& args, std::string& out);

/** @brief Parse one reply. Returns false on I/O or protocol error. */
bool respParseReply(RespReader& in, RespReply& out, uint8_t depth = 0);

/**
 * @file RespCodec.cpp
 * @brief Implementation file.
 */
#include "RespCodec.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace {

bool parseInteger(const std::string& s, size_t from, long long& out)
{
    if (from >= s.size()) return false;
    const char* begin = s.c_str() + from;
    char* end = nullptr;
    errno = 0;
    const long long v = strtoll(begin, &end, 10);
    if (errno != 0 || end == begin || *end != '\0') return false;
    out = v;
    return true;
}

}  // namespace

void respEncodeCommand(const std::vector<std::string>& args, std::string& out)
{
    out.clear();
    out += '*';
    out += std::to_string(args.size());
    out += "\r\n";
    for (const std::string& a : args) {
        out += '$';
        out += std::to_string(a.size());
        out += "\r\n";
        out += a;
        out += "\r\n";
    }
}

bool respParseReply(RespReader& in, RespReply& out, uint8_t depth)
{
    if (depth > RESP_MAX_DEPTH) return false;

    std::string line;
    if (!in.readLine(line) || line.empty()) return false;

    out = RespReply{};
    const char prefix = line[0];
    switch (prefix) {
    case '+':
        out.type = RespReply::Type::Status;
        out.str = line.substr(1);
        return true;
    case '-':
        out.type = RespReply::Type::Error;
        out.str = line.substr(1);
        return true;
    case ':':
        out.type = RespReply::Type::Integer;
        return parseInteger(line, 1, out.integer);
    case '$': {
        long long len = 0;
        if (!parseInteger(line, 1, len)) return false;
        if (len < 0) {
            out.type = RespReply::Type::Nil;
            return true;
        }
        if (len > RESP_MAX_BULK) return false;
        std::string data;
        if (!in.readExact((size_t)len + 2, data)) return false;
        if (data[(size_t)len] != '\r' || data[(size_t)len + 1] != '\n') return false;
        data.resize((size_t)len);
        out.type = RespReply::Type::Bulk;
        out.str.swap(data);
        return true;
    }
    case '*': {
        long long count = 0;
        if (!parseInteger(line, 1, count)) return false;
        if (count < 0) {
            out.type = RespReply::Type::Nil;
            return true;
        }
        if (count > RESP_MAX_ARRAY) return false;
        out.type = RespReply::Type::Array;
        out.elements.reserve((size_t)std::min<long long>(count, 256));
        for (long long i = 0; i < count; ++i) {
            RespReply item;
            if (!respParseReply(in, item, (uint8_t)(depth + 1))) return false;
            out.elements.push_back(std::move(item));
        }
        return true;
    }
    default:
        return false;
    }
}

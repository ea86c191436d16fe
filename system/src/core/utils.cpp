#include "core/utils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace facegate {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

static std::tm local_tm(int64_t ts_ms) {
    std::time_t t = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string format_timestamp(int64_t ts_ms) {
    std::tm tm = local_tm(ts_ms);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string format_iso8601(int64_t ts_ms) {
    std::tm tm = local_tm(ts_ms);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << (ts_ms % 1000);
    return ss.str();
}

std::string random_hex(size_t num_bytes, bool uppercase) {
    static std::mutex gen_mutex;
    static std::mt19937_64 gen(std::random_device{}());
    static std::uniform_int_distribution<int> dis(0, 255);

    const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";

    std::string out;
    out.reserve(num_bytes * 2);

    std::lock_guard<std::mutex> lock(gen_mutex);
    for (size_t i = 0; i < num_bytes; i++) {
        int b = dis(gen);
        out += digits[(b >> 4) & 0x0F];
        out += digits[b & 0x0F];
    }
    return out;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ==================== BASE64 ====================

static const char B64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int b64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

bool base64_decode(const std::string& in, std::vector<unsigned char>& out) {
    out.clear();
    out.reserve(in.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    bool padding = false;

    for (unsigned char c : in) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) return false;  // datos despues del padding

        int v = b64_value(c);
        if (v < 0) return false;

        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<unsigned char>((buffer >> bits) & 0xFF));
        }
    }

    // 6 bits sueltos no forman un byte
    return bits < 6;
}

std::string base64_encode(const unsigned char* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += B64_CHARS[(n >> 18) & 0x3F];
        out += B64_CHARS[(n >> 12) & 0x3F];
        out += B64_CHARS[(n >> 6) & 0x3F];
        out += B64_CHARS[n & 0x3F];
    }

    if (i < len) {
        uint32_t n = data[i] << 16;
        if (i + 1 < len) n |= data[i + 1] << 8;

        out += B64_CHARS[(n >> 18) & 0x3F];
        out += B64_CHARS[(n >> 12) & 0x3F];
        out += (i + 1 < len) ? B64_CHARS[(n >> 6) & 0x3F] : '=';
        out += '=';
    }

    return out;
}

}  // namespace facegate

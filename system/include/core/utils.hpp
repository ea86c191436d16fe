// ============= include/core/utils.hpp =============
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace facegate {

// Tiempo actual en milisegundos Unix
int64_t now_ms();

// "2025-11-24 14:30:52" (hora local)
std::string format_timestamp(int64_t ts_ms);

// "2025-11-24T14:30:52.123" (hora local)
std::string format_iso8601(int64_t ts_ms);

// Token hexadecimal de num_bytes bytes aleatorios (2 * num_bytes caracteres)
std::string random_hex(size_t num_bytes, bool uppercase = false);

std::string trim(const std::string& s);

// Base64 estandar (RFC 4648). Ignora espacios y saltos de linea.
bool base64_decode(const std::string& in, std::vector<unsigned char>& out);
std::string base64_encode(const unsigned char* data, size_t len);

}  // namespace facegate

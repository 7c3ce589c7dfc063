#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string hex_from_bytes(const unsigned char* data, std::size_t size);
bool bytes_from_hex(const std::string& hex, std::vector<unsigned char>& out);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size);
std::string sha256_hex(const std::string &data);

// Makes a single path component out of an arbitrary remote name.
std::string sanitize_name(const std::string& name);
// Reversible single path component: [A-Za-z0-9_-] kept, every other byte as
// %XX, the empty string as "%". Distinct inputs never share an output.
std::string escape_path_component(const std::string& name);
// Lower-cased extension including the leading dot, or "" when there is none.
std::string extension_of(const std::string& file_name);
std::string to_lower_copy(std::string value);
std::string trim_copy(std::string value);
std::string format_size(uint64_t bytes);

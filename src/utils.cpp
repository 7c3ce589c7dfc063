#include "utils.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

bool bytes_from_hex(const std::string& hex, std::vector<unsigned char>& out){
    if(hex.size() % 2 != 0) return false;
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    out.clear();
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if(hi < 0 || lo < 0) return false;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return true;
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    return sha256_bytes(data.data(), data.size());
}

std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data, size, out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string sanitize_name(const std::string& name){
    std::string out;
    out.reserve(name.size());
    for(unsigned char c : name){
        if(c == '/' || c == '\\' || c < 0x20 || c == 0x7f){
            out.push_back('_');
        } else if(c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|'){
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    // trailing dots and spaces are trouble on some filesystems
    while(!out.empty() && (out.back() == '.' || out.back() == ' ')) out.pop_back();
    while(!out.empty() && out.front() == ' ') out.erase(out.begin());
    if(out.empty() || out == "..") return "unnamed";
    return out;
}

std::string escape_path_component(const std::string& name){
    static const char* digits = "0123456789ABCDEF";
    if(name.empty()) return "%";
    std::string out;
    out.reserve(name.size());
    for(unsigned char c : name){
        if(std::isalnum(c) || c == '_' || c == '-'){
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0f]);
        }
    }
    return out;
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string extension_of(const std::string& file_name){
    auto slash = file_name.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? file_name : file_name.substr(slash + 1);
    auto dot = base.find_last_of('.');
    if(dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return "";
    return to_lower_copy(base.substr(dot));
}

std::string format_size(uint64_t bytes){
    static const char* suffixes[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    double value = static_cast<double>(bytes);
    std::size_t idx = 0;
    while(value >= 1023.5 && idx + 1 < sizeof(suffixes) / sizeof(suffixes[0])){
        value /= 1024.0;
        ++idx;
    }
    std::ostringstream oss;
    if(idx == 0){
        oss << bytes << " " << suffixes[idx];
    } else {
        oss << std::fixed << std::setprecision(2) << value << " " << suffixes[idx];
    }
    return oss.str();
}

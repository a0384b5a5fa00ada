#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

bool is_hex_string(const std::string& value, std::size_t expected_length){
    if(value.empty()) return false;
    if(expected_length != 0 && value.size() != expected_length) return false;
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char ch){ return std::isxdigit(ch) != 0; });
}

std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0 || !is_hex_string(hex)) return std::nullopt;
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        out.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_hex(const char* data, std::size_t size){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data), size, out.data());
    return hex_from_bytes(out);
}

Sha256Stream::Sha256Stream()
  : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha256Stream::~Sha256Stream(){
    EVP_MD_CTX_free(ctx_);
}

void Sha256Stream::update(const char* data, std::size_t size){
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_, data, size) != 1){
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256Stream::final_hex(){
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx_, out.data(), &length) != 1){
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    out.resize(length);
    return hex_from_bytes(out);
}

std::string random_hex(std::size_t count){
    std::vector<unsigned char> bytes(count);
    if(RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return hex_from_bytes(bytes);
}

uint64_t unix_time_ms(){
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string format_file_size(uint64_t bytes){
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if(bytes < 1024){
        oss.str("");
        oss << bytes << " bytes";
    } else if(bytes < 1024ULL * 1024){
        oss << bytes / 1024.0 << " KB";
    } else if(bytes < 1024ULL * 1024 * 1024){
        oss << bytes / (1024.0 * 1024.0) << " MB";
    } else {
        oss << bytes / (1024.0 * 1024.0 * 1024.0) << " GB";
    }
    return oss.str();
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::vector<std::string> split_list(const std::string& value, char separator){
    std::vector<std::string> out;
    std::string item;
    std::istringstream iss(value);
    while(std::getline(iss, item, separator)){
        item = trim_copy(item);
        if(!item.empty()) out.push_back(item);
    }
    return out;
}

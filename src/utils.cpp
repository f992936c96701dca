#include "utils.hpp"
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::optional<std::string> sha256_file_hex(const std::filesystem::path& path){
    std::string content;
    if(!read_text_file(path, content)) return std::nullopt;
    return sha256_hex(content);
}

std::string local_hostname(){
    char hostname[256];
    if(gethostname(hostname, sizeof(hostname)) != 0) {
        return "unknown";
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return hostname;
}

std::string current_user_name(){
    if(const passwd* pw = getpwuid(geteuid())) {
        if(pw->pw_name && *pw->pw_name) return pw->pw_name;
    }
    if(const char* user = std::getenv("USER")) {
        if(*user) return user;
    }
    return "user";
}

std::filesystem::path home_directory(){
    if(const char* home = std::getenv("HOME")) {
        if(*home) return home;
    }
    if(const passwd* pw = getpwuid(geteuid())) {
        if(pw->pw_dir && *pw->pw_dir) return pw->pw_dir;
    }
    return "/";
}

std::filesystem::path expand_home(const std::string& raw){
    if(raw == "~") return home_directory();
    if(raw.rfind("~/", 0) == 0) return home_directory() / raw.substr(2);
    return raw;
}

bool read_text_file(const std::filesystem::path& path, std::string& out){
    std::ifstream in(path, std::ios::binary);
    if(!in) return false;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

bool path_within(const std::filesystem::path& candidate, const std::filesystem::path& root){
    auto c = candidate.lexically_normal();
    auto r = root.lexically_normal();
    if(!r.empty() && r.filename().empty()) r = r.parent_path();
    auto rel = c.lexically_relative(r);
    if(rel.empty()) return false;
    auto first = *rel.begin();
    return first != "..";
}

TempFile::TempFile(const std::string& prefix){
    auto pattern = (std::filesystem::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    int fd = mkstemp(buffer.data());
    if(fd < 0) return;
    ::close(fd);
    path_ = buffer.data();
}

TempFile::~TempFile(){
    if(path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

bool TempFile::write(const std::string& content){
    if(path_.empty()) return false;
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if(!out) return false;
    out << content;
    return static_cast<bool>(out);
}

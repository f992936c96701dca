#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::optional<std::string> sha256_file_hex(const std::filesystem::path& path);

std::string local_hostname();
std::string current_user_name();
std::filesystem::path home_directory();
std::filesystem::path expand_home(const std::string& raw);

bool read_text_file(const std::filesystem::path& path, std::string& out);

// Lexical containment check; neither path is touched on disk.
bool path_within(const std::filesystem::path& candidate, const std::filesystem::path& root);

// Owns a file created with mkstemp and removes it when destroyed.
class TempFile {
public:
  explicit TempFile(const std::string& prefix);
  ~TempFile();

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  bool valid() const { return !path_.empty(); }
  const std::filesystem::path& path() const { return path_; }
  bool write(const std::string& content);

private:
  std::filesystem::path path_;
};

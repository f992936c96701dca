#include "symlink_manifest.hpp"

#include <sstream>

namespace {

std::string root_prefix(const std::filesystem::path& root) {
  auto text = root.lexically_normal().generic_string();
  while(text.size() > 1 && text.back() == '/') text.pop_back();
  return text;
}

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
  if(from.empty()) return;
  std::size_t pos = 0;
  while((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

} // namespace

std::string escape_manifest_field(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(char ch : value) {
    switch(ch) {
      case '\\': out += "\\\\"; break;
      case '\t': out += "\\t"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      default: out.push_back(ch); break;
    }
  }
  return out;
}

std::optional<std::string> unescape_manifest_field(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(std::size_t i = 0; i < value.size(); ++i) {
    char ch = value[i];
    if(ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if(++i >= value.size()) return std::nullopt;
    switch(value[i]) {
      case '\\': out.push_back('\\'); break;
      case 't': out.push_back('\t'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      default: return std::nullopt;
    }
  }
  return out;
}

std::string format_manifest_record(const SymlinkRecord& record) {
  return escape_manifest_field(record.link_path) + "\t" + escape_manifest_field(record.target);
}

std::optional<SymlinkRecord> parse_manifest_record(const std::string& line, std::string& error) {
  auto tab = line.find('\t');
  if(tab == std::string::npos) {
    error = "missing field separator";
    return std::nullopt;
  }
  if(line.find('\t', tab + 1) != std::string::npos) {
    error = "more than two fields";
    return std::nullopt;
  }
  auto link_path = unescape_manifest_field(line.substr(0, tab));
  auto target = unescape_manifest_field(line.substr(tab + 1));
  if(!link_path || !target) {
    error = "invalid escape sequence";
    return std::nullopt;
  }
  if(link_path->empty() || target->empty()) {
    error = "empty field";
    return std::nullopt;
  }
  SymlinkRecord record;
  record.link_path = std::move(*link_path);
  record.target = std::move(*target);
  return record;
}

std::string serialize_manifest(const std::vector<SymlinkRecord>& records) {
  std::string out;
  for(const auto& record : records) {
    out += format_manifest_record(record);
    out += '\n';
  }
  return out;
}

std::vector<ManifestLine> parse_manifest(const std::string& content) {
  std::vector<ManifestLine> lines;
  std::istringstream in(content);
  std::string line;
  std::size_t number = 0;
  while(std::getline(in, line)) {
    ++number;
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) continue;
    ManifestLine parsed;
    parsed.line_number = number;
    parsed.record = parse_manifest_record(line, parsed.error);
    lines.push_back(std::move(parsed));
  }
  return lines;
}

std::string normalize_link_target(const std::string& raw, const std::filesystem::path& local_root) {
  const auto root = root_prefix(local_root);
  if(root.size() > 1) {
    if(raw == root) return kHomePlaceholder;
    if(starts_with(raw, root + "/")) return kHomePlaceholder + raw.substr(root.size());
  }
  const std::string home = "/home/";
  if(starts_with(raw, home)) {
    auto slash = raw.find('/', home.size());
    if(slash != std::string::npos && slash > home.size()) {
      return kHomePlaceholder + raw.substr(slash);
    }
  }
  return raw;
}

std::string resolve_link_target(const std::string& stored,
                                const std::filesystem::path& local_root,
                                const std::string& user) {
  auto target = normalize_link_target(stored, local_root);
  if(target == kHomePlaceholder) {
    target = root_prefix(local_root);
  } else if(starts_with(target, kHomePlaceholder + "/")) {
    target = root_prefix(local_root) + target.substr(kHomePlaceholder.size());
  }
  replace_all(target, kUserPlaceholder, user);
  return target;
}

bool is_safe_link_path(const std::string& link_path) {
  if(link_path.empty() || link_path.front() == '/') return false;
  std::filesystem::path path(link_path);
  for(const auto& part : path) {
    if(part == "..") return false;
  }
  auto normal = path.lexically_normal().generic_string();
  return !normal.empty() && normal != "." && normal != "./";
}

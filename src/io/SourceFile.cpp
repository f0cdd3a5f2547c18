#include "io/SourceFile.hpp"
#include "llvm/Support/ConvertUTF.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
namespace pystyle {

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::ostringstream ss; ss << ifs.rdbuf(); out = ss.str();
  return true;
}

// Drops "." segments and repeated separators; ".." is kept as written
static std::string displayPath(const fs::path& p) {
  fs::path out;
  for (const auto& part : p) {
    if (part.empty() || part == ".") continue;
    out /= part;
  }
  if (out.empty()) return p.has_root_directory() ? p.root_path().string() : ".";
  return out.string();
}

std::string normalizeNewlines(llvm::StringRef text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\r') { out.push_back(text[i]); continue; }
    out.push_back('\n');
    if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
  }
  return out;
}

std::vector<llvm::StringRef> splitLines(llvm::StringRef text) {
  std::vector<llvm::StringRef> lines;
  while (!text.empty()) {
    size_t eol = text.find('\n');
    size_t len = eol == llvm::StringRef::npos ? text.size() : eol + 1;
    lines.push_back(text.take_front(len));
    text = text.drop_front(len);
  }
  return lines;
}

bool readSourceFile(const std::string& path, std::string& out, std::string* error) {
  std::string raw;
  if (!readFile(path, raw)) {
    if (error) *error = "Failed to read " + path;
    return false;
  }

  const auto* begin = reinterpret_cast<const llvm::UTF8*>(raw.data());
  const llvm::UTF8* cursor = begin;
  if (!llvm::isLegalUTF8String(&cursor, begin + raw.size())) {
    if (error) *error = path + ": invalid UTF-8 at byte offset " + std::to_string(cursor - begin);
    return false;
  }

  out = normalizeNewlines(raw);
  return true;
}

bool collectInputs(const std::string& path, llvm::StringRef extension,
                   std::vector<std::string>& out, std::string* error) {
  std::error_code ec;
  fs::file_status st = fs::status(path, ec);
  if (ec || !fs::exists(st)) {
    if (error) *error = path + ": No such file or directory";
    return false;
  }
  if (fs::is_regular_file(st)) {
    out.push_back(displayPath(path));
    return true;
  }
  if (!fs::is_directory(st)) {
    if (error) *error = path + ": not a regular file or directory";
    return false;
  }

  // Direct children only
  std::vector<std::string> found;
  for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code fileEc;
    if (!it->is_regular_file(fileEc)) continue;
    std::string name = it->path().filename().string();
    if (!llvm::StringRef(name).endswith(extension)) continue;
    found.push_back(displayPath(it->path()));
  }
  if (ec) {
    if (error) *error = path + ": " + ec.message();
    return false;
  }
  std::sort(found.begin(), found.end());
  out.insert(out.end(), found.begin(), found.end());
  return true;
}

} // namespace pystyle

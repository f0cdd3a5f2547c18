#include "analyzers/FindingsStore.hpp"

namespace pystyle {

void FindingsStore::add(const std::string& file, Finding finding) {
  ByFile[file].push_back(finding);
}

void FindingsStore::append(const std::string& file, const FindingList& findings) {
  if (findings.empty()) return;
  auto& list = ByFile[file];
  list.insert(list.end(), findings.begin(), findings.end());
}

const FindingList& FindingsStore::findingsFor(const std::string& file) const {
  static const FindingList kNone;
  auto it = ByFile.find(file);
  return it == ByFile.end() ? kNone : it->second;
}

std::vector<std::string> FindingsStore::files() const {
  std::vector<std::string> out;
  out.reserve(ByFile.size());
  for (const auto& [file, findings] : ByFile) out.push_back(file);
  return out;
}

size_t FindingsStore::size() const {
  size_t n = 0;
  for (const auto& [file, findings] : ByFile) n += findings.size();
  return n;
}

void FindingsStore::print(llvm::raw_ostream& os) const {
  for (const auto& [file, findings] : ByFile) {
    for (const auto& f : findings) {
      os << file << ": Line " << f.line << ": " << ruleId(f.code) << " "
         << ruleDescription(f.code) << "\n";
    }
  }
}

} // namespace pystyle

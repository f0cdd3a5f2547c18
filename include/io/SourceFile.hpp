#pragma once
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace pystyle {

// Reads a source file as UTF-8 text. "\r\n" and lone '\r' become '\n'.
bool readSourceFile(const std::string& path, std::string& out, std::string* error);

std::string normalizeNewlines(llvm::StringRef text);

// Physical lines; each keeps its '\n' except possibly the last one
std::vector<llvm::StringRef> splitLines(llvm::StringRef text);

// A regular file yields itself; a directory yields its direct children whose
// names end with extension, sorted. Paths come back with "." segments and repeated separators dropped.
bool collectInputs(const std::string& path, llvm::StringRef extension,
                   std::vector<std::string>& out, std::string* error);

} // namespace pystyle

#include "RemoteListing.hpp"
#include <cctype>
#include <sstream>

static const size_t METADATA_FIELDS = 6;

std::string RemoteListing::shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string RemoteListing::command(const std::string& remotePath) {
    return "ls -lt --time-style=+%s " + shellQuote(remotePath);
}

static bool parseUnsigned(const std::string& text, uint64_t& value) {
    if (text.empty()) return false;
    uint64_t result = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        result = result * 10 + static_cast<uint64_t>(c - '0');
    }
    value = result;
    return true;
}

bool RemoteListing::parseLine(const std::string& line, RemoteFileEntry& entry) {
    std::vector<std::string> fields;
    size_t pos = 0;
    
    // 先取出前6个元数据字段，剩余部分整体作为文件名（允许包含空格）
    while (fields.size() < METADATA_FIELDS) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) pos++;
        if (pos >= line.size()) return false;
        size_t end = pos;
        while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) end++;
        fields.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    
    // 字段和文件名之间只有一个空格
    if (pos < line.size() && line[pos] == ' ') pos++;
    std::string name = line.substr(pos);
    while (!name.empty() && (name.back() == '\r' || name.back() == '\n')) name.pop_back();
    if (name.empty()) return false;
    
    // 只处理普通文件
    if (fields[0].empty() || fields[0][0] != '-') return false;
    
    uint64_t size = 0;
    uint64_t mtime = 0;
    if (!parseUnsigned(fields[4], size) || !parseUnsigned(fields[5], mtime)) return false;
    
    entry.fileName = name;
    entry.size = size;
    entry.modificationTime = static_cast<int64_t>(mtime);
    return true;
}

std::vector<RemoteFileEntry> RemoteListing::parse(const std::string& output) {
    std::vector<RemoteFileEntry> entries;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        RemoteFileEntry entry;
        if (parseLine(line, entry)) {
            entries.push_back(entry);
        }
    }
    return entries;
}

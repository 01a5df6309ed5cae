#include "ServerConfig.hpp"
#include <cctype>
#include <cstdio>

static std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(begin, end - begin);
}

bool BackupTime::parse(const std::string& text, BackupTime& out) {
    std::string value = trim(text);
    // 允许 "H:MM" 与 "HH:MM"
    size_t colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || value.size() - colon - 1 != 2) {
        return false;
    }
    for (size_t i = 0; i < value.size(); i++) {
        if (i != colon && !std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    int hour = std::stoi(value.substr(0, colon));
    int minute = std::stoi(value.substr(colon + 1));
    if (hour > 23 || minute > 59) {
        return false;
    }
    out.hour = hour;
    out.minute = minute;
    return true;
}

std::string BackupTime::toString() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return buf;
}

std::vector<std::string> ServerConfig::missingFields() const {
    std::vector<std::string> missing;
    if (address.empty()) missing.push_back("address");
    if (username.empty()) missing.push_back("username");
    if (password.empty()) missing.push_back("password");
    if (sourcePath.empty()) missing.push_back("source_path");
    if (primaryBackupPath.empty()) missing.push_back("primary_backup_path");
    return missing;
}

bool ServerConfig::isValid() const {
    return missingFields().empty();
}

std::string ServerConfig::displayName() const {
    return name.empty() ? address : name;
}

std::vector<std::string> splitCommaList(const std::string& text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string item = trim(text.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

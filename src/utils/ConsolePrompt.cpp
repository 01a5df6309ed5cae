#include "ConsolePrompt.hpp"
#include "FileSystem.hpp"
#include <algorithm>
#include <cctype>

ConsolePrompt::ConsolePrompt(std::istream& input, std::ostream& output) : in(input), out(output) {
}

std::string ConsolePrompt::readLine() {
    std::string line;
    if (!std::getline(in, line)) {
        return "";
    }
    // 去掉首尾空白
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    line.erase(line.begin(), std::find_if(line.begin(), line.end(), notSpace));
    line.erase(std::find_if(line.rbegin(), line.rend(), notSpace).base(), line.end());
    return line;
}

bool ConsolePrompt::confirm(const std::string& prompt) {
    out << prompt << " (yes/no): " << std::flush;
    std::string answer = readLine();
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "yes" || answer == "y";
}

std::string ConsolePrompt::chooseOrCreateFolder(const std::string& basePath) {
    out << "Enter the backup folder path on the drive " << basePath
        << " (leave blank to create a new folder): " << std::flush;
    std::string selected = readLine();
    if (!selected.empty()) {
        fs::path path(selected);
        if (path.is_relative()) {
            path = fs::path(basePath) / path;
        }
        if (!FileSystem::createDirectories(path.string())) {
            out << "Cannot use folder " << path.string() << std::endl;
            return "";
        }
        return path.string();
    }
    
    out << "Enter new folder name: " << std::flush;
    std::string folderName = readLine();
    if (folderName.empty()) {
        return "";
    }
    fs::path created = fs::path(basePath) / FileSystem::sanitizeFileName(folderName);
    if (!FileSystem::createDirectories(created.string())) {
        out << "Cannot create folder " << created.string() << std::endl;
        return "";
    }
    return created.string();
}

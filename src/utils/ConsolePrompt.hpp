#pragma once
#include "Notifier.hpp"
#include <iostream>
#include <string>

// 基于终端的交互确认
class ConsolePrompt : public IUserPrompt {
private:
    std::istream& in;
    std::ostream& out;

    std::string readLine();

public:
    ConsolePrompt(std::istream& input = std::cin, std::ostream& output = std::cout);

    bool confirm(const std::string& prompt) override;
    std::string chooseOrCreateFolder(const std::string& basePath) override;
};

#include <cli/terminal.h>
#include <iostream>
#include <string>

namespace lanlink::cli {

void Terminal::ClearScreen() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\033[2J\033[H";
    std::cout.flush();
}

std::optional<std::string> Terminal::ReadLine() {
    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::string Terminal::Ask(const std::string& question) {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout << question;
        std::cout.flush();
    }
    return ReadLine().value_or(std::string{});
}

void Terminal::Print(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << message << std::endl;
}

void Terminal::PrintInfo(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\033[32m[INFO] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintError(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintPrompt() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "> ";
    std::cout.flush();
}

} // namespace lanlink::cli

#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace lanlink::cli {

// Line-oriented console. Output may come from the feedback thread while the prompt waits
// for input, so every print is serialized.
class Terminal {
public:
    Terminal() = default;
    ~Terminal() = default;

    void ClearScreen();

    // std::nullopt once stdin is closed
    std::optional<std::string> ReadLine();
    std::string Ask(const std::string& question);

    void Print(const std::string& message);
    void PrintInfo(const std::string& message);
    void PrintError(const std::string& message);
    void PrintPrompt();

private:
    std::mutex output_mutex_;
};

} // namespace lanlink::cli

#pragma once

#include <core/model/feedback.h>
#include <core/network/reliability/reliable_sender.h>
#include <core/network/transfer/send_session.h>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lanlink::core {

// Runs every outbound file transfer on its own thread
class SendSessionManager {
public:
    SendSessionManager(ReliableSender& sender,
                       std::string local_name,
                       FeedbackCallback callback = nullptr);
    ~SendSessionManager();
    SendSessionManager(const SendSessionManager&) = delete;
    SendSessionManager& operator=(const SendSessionManager&) = delete;

    // Hands the transfer off and returns its file id. The outcome is reported through
    // a kSendSessionEnded feedback event.
    std::string SendFile(const std::string& device_name,
                         const Endpoint& target,
                         const std::filesystem::path& file_path);

    // Joins every transfer thread
    void WaitAll();

private:
    struct RunningSession {
        std::shared_ptr<SendSession> session;
        std::future<SendResult> result;
    };

    void reapFinished();

    ReliableSender& sender_;
    std::string local_name_;
    FeedbackCallback callback_;

    std::mutex sessions_mutex_;
    std::vector<RunningSession> send_sessions_;
};

} // namespace lanlink::core

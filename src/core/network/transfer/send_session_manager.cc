#include <chrono>
#include <core/network/transfer/send_session_manager.h>
#include <spdlog/spdlog.h>

namespace lanlink::core {

SendSessionManager::SendSessionManager(ReliableSender& sender,
                                       std::string local_name,
                                       FeedbackCallback callback)
    : sender_(sender)
    , local_name_(std::move(local_name))
    , callback_(callback) {}

SendSessionManager::~SendSessionManager() {
    WaitAll();
}

std::string SendSessionManager::SendFile(const std::string& device_name,
                                         const Endpoint& target,
                                         const std::filesystem::path& file_path) {
    auto send_session = std::make_shared<SendSession>(sender_,
                                                      local_name_,
                                                      device_name,
                                                      target,
                                                      file_path,
                                                      callback_);
    auto file_id = send_session->file_id();

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    reapFinished();
    send_sessions_.push_back(RunningSession{
        .session = send_session,
        .result = std::async(std::launch::async, [send_session]() { return send_session->Run(); }),
    });
    spdlog::debug("SendSession {} started, {} running", file_id, send_sessions_.size());
    return file_id;
}

void SendSessionManager::WaitAll() {
    std::vector<RunningSession> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(send_sessions_);
    }
    for (auto& running : sessions) {
        try {
            auto result = running.result.get();
            spdlog::debug("SendSession {} joined: {}",
                          running.session->file_id(),
                          ToString(result));
        } catch (const std::exception& e) {
            spdlog::error("SendSession {} terminated: {}", running.session->file_id(), e.what());
        }
    }
}

void SendSessionManager::reapFinished() {
    std::erase_if(send_sessions_, [](RunningSession& running) {
        if (running.result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }
        spdlog::debug("SendSession {} cleaned up", running.session->file_id());
        return true;
    });
}

} // namespace lanlink::core

#pragma once

#include <atomic>
#include <core/model/feedback.h>
#include <core/model/send_result.h>
#include <core/network/reliability/reliable_sender.h>
#include <core/network/transport/transport.h>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lanlink::core {

enum class SessionStatus {
    kIdle,       // 尚未开始
    kAnnouncing, // 发送 FILE，等待接收方确认
    kSending,    // 逐块发送 CHUNK
    kFinishing,  // 发送 END，等待接收方校验
    kCompleted,  // 接收方校验通过
    kFailed,     // 被拒绝、超时或本地读取失败
    kCancelled,  // 发送过程中程序退出
};

// Sender side of one file transfer: FILE, then every CHUNK in ascending order, then END,
// each step delivered through the ReliableSender. The first failing step aborts the whole
// transfer.
class SendSession {
public:
    SendSession(ReliableSender& sender,
                std::string local_name,
                std::string device_name,
                Endpoint target,
                std::filesystem::path file_path,
                FeedbackCallback callback = nullptr);
    ~SendSession() = default;
    SendSession(const SendSession&) = delete;
    SendSession& operator=(const SendSession&) = delete;

    // Blocks until the transfer ends. Never throws; local I/O errors are reported as kFailed.
    SendResult Run();

    const std::string& file_id() const { return file_id_; }
    const std::string& file_name() const { return file_name_; }
    const std::string& device_name() const { return device_name_; }
    SessionStatus session_status() const { return session_status_; }

private:
    SendResult announce();
    SendResult sendChunks();
    SendResult finish();

    SendResult fail(SendResult result, const std::string& error_message);

    void feedback(FeedbackType type, const nlohmann::json& data) const {
        if (callback_) {
            callback_(type, data);
        }
    }

    ReliableSender& sender_;
    std::string device_name_;
    Endpoint target_;
    std::filesystem::path file_path_;
    FeedbackCallback callback_;

    std::string file_id_;
    std::string file_name_; // whitespace replaced, as announced on the wire
    std::uint64_t file_size_ = 0;
    std::size_t total_chunks_ = 0;
    std::string file_checksum_;
    std::atomic<SessionStatus> session_status_ = SessionStatus::kIdle;
};

} // namespace lanlink::core

#pragma once

#include <nlohmann/json.hpp>

namespace lanlink::core {

enum class FeedbackType {
    kFoundDevice,             // 收到新设备的心跳（设备名、地址）
    kLostDevice,              // 设备超时被清除（只包含设备名）
    kMessageReceived,         // 收到新的 TALK 消息（重复消息不会触发）
    kFileReceivingStarted,    // 收到新的 FILE 请求
    kFileReceivingProgress,   // 接收进度（file_id，文件名，百分比）
    kFileReceivingCompleted,  // 文件通过 Hash 校验并已保存
    kReceiveSessionEnded,     // 接收失败结束（校验失败、写入失败或超时）
    kFileSendingProgress,     // 发送进度（file_id，文件名，百分比）
    kSendSessionEnded,        // 发送结束（成功或失败原因）
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kFoundDevice, "FoundDevice"},
                                 {FeedbackType::kLostDevice, "LostDevice"},
                                 {FeedbackType::kMessageReceived, "MessageReceived"},
                                 {FeedbackType::kFileReceivingStarted, "FileReceivingStarted"},
                                 {FeedbackType::kFileReceivingProgress, "FileReceivingProgress"},
                                 {FeedbackType::kFileReceivingCompleted, "FileReceivingCompleted"},
                                 {FeedbackType::kReceiveSessionEnded, "ReceiveSessionEnded"},
                                 {FeedbackType::kFileSendingProgress, "FileSendingProgress"},
                                 {FeedbackType::kSendSessionEnded, "SendSessionEnded"},
                             });

} // namespace lanlink::core

#pragma once

#include "feedback/feedback_type.h"
#include "feedback/file_receiving_completed.h"
#include "feedback/file_receiving_progress.h"
#include "feedback/file_receiving_started.h"
#include "feedback/file_sending_progress.h"
#include "feedback/found_device.h"
#include "feedback/lost_device.h"
#include "feedback/message_received.h"
#include "feedback/receive_session_end.h"
#include "feedback/send_session_end.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace lanlink::core {

using FeedbackCallback = std::function<void(FeedbackType type, const nlohmann::json& data)>;

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

} // namespace lanlink::core

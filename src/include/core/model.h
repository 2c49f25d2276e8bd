#pragma once

#include "model/device_info.h"
#include "model/feedback.h"
#include "model/file_receive_context.h"
#include "model/message.h"
#include "model/send_result.h"

#ifndef PARKGATE_ACTUATOR_CHANNEL_H
#define PARKGATE_ACTUATOR_CHANNEL_H

#include <string>
#include <vector>

namespace parkgate {
namespace gate {

namespace ActuatorCommands {
    // 出站命令 (newline 结尾发送)
    const std::string OPEN_ENTRY_GATE  = "OPEN_ENTRY_GATE";
    const std::string CLOSE_ENTRY_GATE = "CLOSE_ENTRY_GATE";
    const std::string OPEN_EXIT_GATE   = "OPEN_EXIT_GATE";
    const std::string CLOSE_EXIT_GATE  = "CLOSE_EXIT_GATE";
    const std::string BUZZER_ON        = "BUZZER_ON";
    const std::string BUZZER_OFF       = "BUZZER_OFF";

    // 入站消息
    const std::string SLOT_OCCUPIED    = "SLOT_OCCUPIED";
    const std::string SLOT_FREE        = "SLOT_FREE";
} // namespace ActuatorCommands

enum class SlotMessage {
    OCCUPIED,
    FREE,
    UNKNOWN
};

// Trims surrounding whitespace before matching.
SlotMessage parseSlotMessage(const std::string& message);

// Command/message channel to the gate microcontroller.
class ActuatorChannel {
public:
    virtual ~ActuatorChannel() = default;

    // false on failure (closed channel, timeout); never throws
    virtual bool send(const std::string& command) = 0;

    // non-blocking: whatever complete lines are buffered, possibly none
    virtual std::vector<std::string> pollMessages() = 0;
};

} // namespace gate
} // namespace parkgate

#endif // PARKGATE_ACTUATOR_CHANNEL_H

#include "hid_reports.hpp"

#include "keyboard_errors.hpp"

#include <iomanip>
#include <sstream>

KeyboardReport makeKeyboardReport(ModifierMask modifiers, const std::vector<KeyCode>& keys)
{
    if (keys.size() > kMaxReportKeys) {
        throw KeyboardError(KeyboardErrorCode::InvalidReportInput,
                            "Keys must be a list with at most " + std::to_string(kMaxReportKeys) + " elements");
    }

    KeyboardReport report{};
    report[0] = modifiers;
    report[1] = 0x00; // reserved
    for (std::size_t i = 0; i < keys.size(); ++i) {
        report[2 + i] = keys[i];
    }
    // remaining key slots default zero
    return report;
}

const KeyboardReport& makeKeyboardReleaseReport()
{
    static const KeyboardReport report{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    return report;
}

std::string formatReport(const KeyboardReport& report)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < report.size(); ++i) {
        if (i != 0) {
            oss << ' ';
        }
        oss << "0x" << std::setw(2) << static_cast<unsigned>(report[i]);
    }
    return oss.str();
}

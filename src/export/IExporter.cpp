#include "laneflow/export/IExporter.h"

namespace laneflow {

std::string escapeXml(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&#x27;"; break;
            default: result += c;
        }
    }

    return result;
}

}  // namespace laneflow

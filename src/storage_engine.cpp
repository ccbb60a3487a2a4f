#include "assetcdn/storage_engine.hpp"

#include <algorithm>
#include <cctype>

namespace assetcdn {

const char* to_string(DownloadPriority priority) {
    switch (priority) {
        case DownloadPriority::Low: return "Low";
        case DownloadPriority::Normal: return "Normal";
        case DownloadPriority::High: return "High";
        case DownloadPriority::Critical: return "Critical";
    }
    return "Normal";
}

bool parse_priority(const std::string& name, DownloadPriority& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "low") out = DownloadPriority::Low;
    else if (lower == "normal") out = DownloadPriority::Normal;
    else if (lower == "high") out = DownloadPriority::High;
    else if (lower == "critical") out = DownloadPriority::Critical;
    else return false;
    return true;
}

}  // namespace assetcdn

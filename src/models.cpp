#include "models.hpp"

#include <algorithm>
#include <stdexcept>

namespace shop_harvest {

int CrawlCheckpoint::resumePage(int firstPage) const {
    if (completedPages.empty()) return firstPage;
    return *std::max_element(completedPages.begin(), completedPages.end()) + 1;
}

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::Pending: return "pending";
        case RunStatus::Running: return "running";
        case RunStatus::Success: return "success";
        case RunStatus::Partial: return "partial";
        case RunStatus::Failed:  return "failed";
    }
    return "unknown";
}

RunStatus parseRunStatus(const std::string& text) {
    if (text == "pending") return RunStatus::Pending;
    if (text == "running") return RunStatus::Running;
    if (text == "success") return RunStatus::Success;
    if (text == "partial") return RunStatus::Partial;
    if (text == "failed")  return RunStatus::Failed;
    throw std::invalid_argument("Unknown run status: " + text);
}

} // namespace shop_harvest

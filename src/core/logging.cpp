#include "logging.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace atl {

namespace {

std::deque<std::string> system_logs;
const std::size_t log_capacity = 200;
std::mutex log_mutex;

} // namespace

void atl_log(const std::string& level, const std::string& message) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S");
    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex);
    while (system_logs.size() >= log_capacity && !system_logs.empty()) {
        system_logs.pop_front();
    }
    system_logs.push_back(log_entry);

    std::cout << log_entry << std::endl;
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

std::vector<std::string> recent_logs(const std::string& level) {
    const std::string tag = "] [" + level + "] ";
    std::vector<std::string> matched;
    std::lock_guard<std::mutex> lock(log_mutex);
    for (const auto& line : system_logs) {
        if (line.find(tag) != std::string::npos) matched.push_back(line);
    }
    return matched;
}

} // namespace atl

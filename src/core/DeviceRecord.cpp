#include "DeviceRecord.h"
#include <chrono>
#include <ctime>

namespace lan_scan {

std::string time_of_day_now(){
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{}; localtime_r(&now, &tm);
    char buf[16]; std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

}

#include "redlight/common.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <numeric>
#include <regex>
#include <sstream>
#include <stdexcept>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <opencv2/imgproc.hpp>

namespace redlight {
namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

}  // namespace

StopLine parseStopLine(const std::string& text) {
    std::vector<int> coords;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            throw std::invalid_argument("Invalid stop line format: empty coordinate in '" + text + "'");
        }
        std::size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(item, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid stop line format: '" + item + "' is not an integer");
        }
        if (consumed != item.size()) {
            throw std::invalid_argument("Invalid stop line format: '" + item + "' is not an integer");
        }
        coords.push_back(value);
    }
    if (coords.size() != 4) {
        throw std::invalid_argument("Stop line must have 4 coordinates (x1,y1,x2,y2), got '" + text + "'");
    }
    return StopLine{Point{coords[0], coords[1]}, Point{coords[2], coords[3]}};
}

std::optional<Timestamp> parseIsoTimestamp(const std::string& text) {
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?)?(Z|[+-]\d{2}:?\d{2})?$)");

    std::smatch m;
    const std::string input = trim(text);
    if (!std::regex_match(input, m, pattern)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(m[1].str()) - 1900;
    tm.tm_mon = std::stoi(m[2].str()) - 1;
    tm.tm_mday = std::stoi(m[3].str());
    tm.tm_hour = m[4].matched ? std::stoi(m[4].str()) : 0;
    tm.tm_min = m[5].matched ? std::stoi(m[5].str()) : 0;
    tm.tm_sec = m[6].matched ? std::stoi(m[6].str()) : 0;

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    std::chrono::microseconds fraction{0};
    if (m[7].matched) {
        std::string digits = m[7].str();
        digits.resize(6, '0');
        fraction = std::chrono::microseconds(std::stol(digits));
    }

    std::time_t seconds = 0;
    if (m[8].matched) {
        seconds = timegm(&tm);
        const std::string zone = m[8].str();
        if (zone != "Z") {
            const int sign = zone[0] == '-' ? -1 : 1;
            const std::string hhmm = zone.substr(1);
            const int hours = std::stoi(hhmm.substr(0, 2));
            const int minutes = std::stoi(hhmm.substr(hhmm.size() - 2));
            seconds -= sign * (hours * 3600 + minutes * 60);
        }
    } else {
        tm.tm_isdst = -1;
        seconds = std::mktime(&tm);
    }
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return Clock::from_time_t(seconds) + std::chrono::duration_cast<Clock::duration>(fraction);
}

std::string formatIsoTimestamp(Timestamp ts) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() % 1000;
    const std::time_t t = Clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return oss.str();
}

std::string formatCompactTimestamp(Timestamp ts) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() % 1000;
    const std::time_t t = Clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_' << std::setw(3) << std::setfill('0')
        << (millis < 0 ? millis + 1000 : millis);
    return oss.str();
}

int localHourOfDay(Timestamp ts) {
    const std::time_t t = Clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm.tm_hour;
}

Timestamp makeLocalTimestamp(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

double roundDecimal(double value, int digits) {
    if (!std::isfinite(value) || digits < 0 || digits > 17) {
        return value;
    }
    // printf rounds the exact binary value, so 10.125 becomes 10.12.
    char buffer[512];
    std::snprintf(buffer, sizeof(buffer), "%.*f", digits, value);
    return std::strtod(buffer, nullptr);
}

std::string detectLocalMac() {
    std::string fallback = "000000000000";
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || !ifaddr) {
        return fallback;
    }

    std::string mac = fallback;
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        freeifaddrs(ifaddr);
        return fallback;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr)
            continue;

        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK))
            continue;

        if (ifa->ifa_addr->sa_family == AF_INET) {
            struct ifreq ifr {};
            std::strncpy(ifr.ifr_name, ifa->ifa_name, IFNAMSIZ - 1);
            if (ioctl(sock, SIOCGIFHWADDR, &ifr) == 0) {
                unsigned char* hw = reinterpret_cast<unsigned char*>(ifr.ifr_hwaddr.sa_data);
                std::ostringstream oss;
                oss << std::hex << std::setfill('0');
                for (int i = 0; i < 6; ++i) {
                    oss << std::setw(2) << static_cast<int>(hw[i]);
                }
                mac = oss.str();
                break;
            }
        }
    }

    close(sock);
    freeifaddrs(ifaddr);
    return mac;
}

cv::Mat extractROI(const cv::Mat& image, const BoundingBox& box) {
    if (image.empty()) {
        return {};
    }
    const cv::Rect roi = box.toRect() & cv::Rect(0, 0, image.cols, image.rows);
    if (roi.width <= 0 || roi.height <= 0) {
        return {};
    }
    return image(roi).clone();
}

PreprocessInfo preprocessLetterbox(const cv::Mat& img, int input_w, int input_h) {
    const int img_w = img.cols;
    const int img_h = img.rows;

    const float scale = std::min(static_cast<float>(input_w) / img_w, static_cast<float>(input_h) / img_h);

    const int new_w = static_cast<int>(img_w * scale);
    const int new_h = static_cast<int>(img_h * scale);

    cv::Mat resized;
    cv::resize(img, resized, cv::Size(new_w, new_h));

    const int pad_x = (input_w - new_w) / 2;
    const int pad_y = (input_h - new_h) / 2;

    cv::Mat letterbox(input_h, input_w, img.type(), cv::Scalar(114, 114, 114));
    resized.copyTo(letterbox(cv::Rect(pad_x, pad_y, new_w, new_h)));
    cv::cvtColor(letterbox, letterbox, cv::COLOR_BGR2RGB);

    cv::Mat float_img;
    letterbox.convertTo(float_img, CV_32F, 1.0 / 255.0);
    std::vector<cv::Mat> chw(3);
    cv::split(float_img, chw);

    PreprocessInfo info;
    info.input_tensor.reserve(static_cast<std::size_t>(input_w) * input_h * 3);
    for (int c = 0; c < 3; ++c) {
        info.input_tensor.insert(info.input_tensor.end(),
                                 reinterpret_cast<const float*>(chw[c].datastart),
                                 reinterpret_cast<const float*>(chw[c].dataend));
    }
    info.scale = scale;
    info.pad_x = pad_x;
    info.pad_y = pad_y;
    return info;
}

float IoU(const cv::Rect2f& a, const cv::Rect2f& b) {
    const float interArea = (a & b).area();
    const float unionArea = a.area() + b.area() - interArea;
    if (unionArea <= 0.0f) {
        return 0.0f;
    }
    return interArea / unionArea;
}

std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iouThreshold) {
    std::vector<int> indices;
    std::vector<int> order(boxes.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&](int i, int j) { return scores[i] > scores[j]; });

    std::vector<bool> suppressed(boxes.size(), false);
    for (std::size_t i = 0; i < order.size(); i++) {
        int idx = order[i];
        if (suppressed[idx]) continue;
        indices.push_back(idx);
        for (std::size_t j = i + 1; j < order.size(); j++) {
            int idx2 = order[j];
            if (IoU(boxes[idx], boxes[idx2]) > iouThreshold)
                suppressed[idx2] = true;
        }
    }
    return indices;
}

}  // namespace redlight

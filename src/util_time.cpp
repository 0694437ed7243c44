// util_time.cpp
#include "util_time.hpp"

#include <chrono>
#include <cctype>
#include <ctime>      // _mkgmtime / timegm
#include <optional>
#include <regex>
#include <string>

namespace util {

    // --- UTC tm* -> time_t portability shim ---
    static std::time_t timegm_portable(std::tm* tm) {
#ifdef _WIN32
        return _mkgmtime(tm);   // MSVC / Windows
#else
        return timegm(tm);      // POSIX
#endif
    }

    static int days_in_month(int year, int month) {
        static constexpr int days[] = { 31,28,31,30,31,30,31,31,30,31,30,31 };
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        if (month == 2 && leap) return 29;
        return days[month - 1];
    }

    static std::optional<std::chrono::system_clock::time_point>
        make_utc(int year, int month, int day, int hour, int minute, int second) {
        if (month < 1 || month > 12) return std::nullopt;
        if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
        if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        return std::chrono::system_clock::from_time_t(timegm_portable(&tm));
    }

    // Trim leading/trailing ASCII whitespace
    std::string trim(const std::string& s) {
        static constexpr char ws[] = " \t\r\n\f\v";
        const auto b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        const auto e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    bool is_blank(const std::string& s) {
        return trim(s).empty();
    }

    std::optional<std::chrono::system_clock::time_point>
        parse_scan_time(const std::string& s) {
        // "M/d/yyyy H:mm", optional seconds, optional AM/PM
        static const std::regex us(
            R"((\d{1,2})/(\d{1,2})/(\d{4})\s+(\d{1,2}):(\d{2})(?::(\d{2}))?(?:\s*([AaPp][Mm]))?)");
        // "yyyy-MM-dd HH:mm[:ss]" / "yyyy-MM-ddTHH:mm[:ss]Z"
        static const std::regex iso(
            R"((\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2})(?::(\d{2}))?Z?)");

        const std::string t = trim(s);
        std::smatch m;

        if (std::regex_match(t, m, us)) {
            const int month = std::stoi(m[1].str());
            const int day = std::stoi(m[2].str());
            const int year = std::stoi(m[3].str());
            int hour = std::stoi(m[4].str());
            const int minute = std::stoi(m[5].str());
            const int second = m[6].matched ? std::stoi(m[6].str()) : 0;

            if (m[7].matched) {
                if (hour < 1 || hour > 12) return std::nullopt;
                const char ap = static_cast<char>(std::toupper(static_cast<unsigned char>(m[7].str()[0])));
                if (ap == 'P' && hour != 12) hour += 12;
                if (ap == 'A' && hour == 12) hour = 0;
            }
            return make_utc(year, month, day, hour, minute, second);
        }

        if (std::regex_match(t, m, iso)) {
            return make_utc(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()),
                            std::stoi(m[4].str()), std::stoi(m[5].str()),
                            m[6].matched ? std::stoi(m[6].str()) : 0);
        }

        return std::nullopt;
    }

} // namespace util

#include "core/Observation.hpp"
#include <cstdio>

namespace WeatherTerm {

static bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

static bool isDigits(const std::string& text, size_t from, size_t count) {
    for (size_t i = from; i < from + count; i++) {
        if (text[i] < '0' || text[i] > '9') return false;
    }
    return true;
}

std::string CivilDate::toString() const {
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string CivilDate::weekdayName() const {
    // Zeller's congruence, 0 = Saturday
    int y = year;
    int m = month;
    if (m < 3) { m += 12; y--; }
    int dow = (day + 13 * (m + 1) / 5 + y + y / 4 - y / 100 + y / 400) % 7;
    const char* weekDays[] = {"Sat", "Sun", "Mon", "Tue", "Wed", "Thu", "Fri"};
    return weekDays[dow];
}

std::string Timestamp::hourLabel() const {
    char buf[8];
    snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return buf;
}

bool parseDate(const std::string& text, CivilDate& out) {
    if (text.size() < 10) return false;
    if (!isDigits(text, 0, 4) || text[4] != '-' || !isDigits(text, 5, 2) ||
        text[7] != '-' || !isDigits(text, 8, 2)) {
        return false;
    }

    CivilDate date;
    if (sscanf(text.c_str(), "%4d-%2d-%2d", &date.year, &date.month, &date.day) != 3) return false;
    if (date.month < 1 || date.month > 12) return false;
    if (date.day < 1 || date.day > daysInMonth(date.year, date.month)) return false;

    out = date;
    return true;
}

bool parseTimestamp(const std::string& text, Timestamp& out) {
    if (text.size() < 16) return false;
    if (text[10] != 'T' && text[10] != ' ') return false;
    if (!isDigits(text, 11, 2) || text[13] != ':' || !isDigits(text, 14, 2)) return false;

    Timestamp ts;
    if (!parseDate(text, ts.date)) return false;
    if (sscanf(text.c_str() + 11, "%2d:%2d", &ts.hour, &ts.minute) != 2) return false;
    if (ts.hour > 23 || ts.minute > 59) return false;

    out = ts;
    return true;
}

}

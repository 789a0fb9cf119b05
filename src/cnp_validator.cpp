#include "cnp_validator.hpp"

#include <cstdio>
#include <ctime>

namespace {

const int kCnpWeights[12] = {2, 7, 9, 1, 4, 6, 3, 5, 8, 2, 7, 9};

CnpValidation fail(const char* reason, const char* message) {
    CnpValidation result;
    result.valid = false;
    result.reason = reason;
    result.message = message;
    return result;
}

int digitAt(const std::string& s, size_t index) {
    return s[index] - '0';
}

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

int currentCalendarYear() {
    std::time_t now = std::time(nullptr);
    std::tm local = {};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return local.tm_year + 1900;
}

// Century base from the sex/century digit, 0 if the digit is not accepted
int centuryBase(int sexDigit) {
    switch (sexDigit) {
        case 1:
        case 2:
            return 1900;
        case 3:
        case 4:
            return 1800;
        case 5:
        case 6:
            return 2000;
        default:
            return 0;
    }
}

}  // namespace

int computeCnpControlDigit(const std::string& cnp) {
    if (cnp.size() < 12) {
        return -1;
    }

    int sum = 0;
    for (size_t i = 0; i < 12; i++) {
        if (!isAsciiDigit(cnp[i])) {
            return -1;
        }
        sum += digitAt(cnp, i) * kCnpWeights[i];
    }

    int remainder = sum % 11;
    return remainder == 10 ? 1 : remainder;
}

CnpValidation validateCnp(const std::string& cnp) {
    return validateCnp(cnp, currentCalendarYear());
}

CnpValidation validateCnp(const std::string& cnp, int currentYear) {
    if (cnp.size() != 13) {
        return fail("length", "CNP must be exactly 13 digits");
    }

    for (char c : cnp) {
        if (!isAsciiDigit(c)) {
            return fail("format", "CNP must contain only digits");
        }
    }

    int base = centuryBase(digitAt(cnp, 0));
    if (base == 0) {
        return fail("century", "Invalid CNP first digit");
    }

    int year = base + digitAt(cnp, 1) * 10 + digitAt(cnp, 2);
    int month = digitAt(cnp, 3) * 10 + digitAt(cnp, 4);
    int day = digitAt(cnp, 5) * 10 + digitAt(cnp, 6);

    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        return fail("date", "Invalid birth date in CNP");
    }

    if (year > currentYear || year < 1800) {
        return fail("year", "Invalid birth year in CNP");
    }

    if (computeCnpControlDigit(cnp) != digitAt(cnp, 12)) {
        return fail("checksum", "Invalid CNP checksum");
    }

    CnpValidation result;
    result.valid = true;
    return result;
}

std::string extractBirthDateFromCnp(const std::string& cnp) {
    if (!validateCnp(cnp).valid) {
        return "";
    }

    int year = centuryBase(digitAt(cnp, 0)) + digitAt(cnp, 1) * 10 + digitAt(cnp, 2);
    int month = digitAt(cnp, 3) * 10 + digitAt(cnp, 4);
    int day = digitAt(cnp, 5) * 10 + digitAt(cnp, 6);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string extractGenderFromCnp(const std::string& cnp) {
    if (!validateCnp(cnp).valid) {
        return "";
    }

    int sexDigit = digitAt(cnp, 0);
    return (sexDigit == 1 || sexDigit == 3 || sexDigit == 5) ? "M" : "F";
}

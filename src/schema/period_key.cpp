/**
 * @file period_key.cpp
 * @brief Period key parsing, ordering and rendering
 */

#include "schema/period_key.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace fundmetrics {
namespace schema {

namespace {

constexpr int kMinYear = 1900;
constexpr int kMaxYear = 2100;

std::string trim(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool all_digits(const std::string& str, size_t pos, size_t len)
{
    if (pos + len > str.size())
    {
        return false;
    }
    for (size_t i = pos; i < pos + len; ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(str[i])))
        {
            return false;
        }
    }
    return true;
}

int to_int(const std::string& str, size_t pos, size_t len)
{
    return std::stoi(str.substr(pos, len));
}

std::optional<PeriodKey> parse_date(const std::string& text)
{
    // Drop a trailing time part ("2024-03-31 00:00:00", "2024-03-31T00:00")
    std::string head = text.substr(0, text.find_first_of(" T"));
    if (head.size() != 10)
    {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0;
    const char sep_a = head[4];
    const char sep_b = head[2];

    if ((sep_a == '-' || sep_a == '/') && head[7] == sep_a &&
        all_digits(head, 0, 4) && all_digits(head, 5, 2) && all_digits(head, 8, 2))
    {
        year = to_int(head, 0, 4);
        month = to_int(head, 5, 2);
        day = to_int(head, 8, 2);
    }
    else if ((sep_b == '-' || sep_b == '/') && head[5] == sep_b &&
             all_digits(head, 0, 2) && all_digits(head, 3, 2) && all_digits(head, 6, 4))
    {
        day = to_int(head, 0, 2);
        month = to_int(head, 3, 2);
        year = to_int(head, 6, 4);
    }
    else
    {
        return std::nullopt;
    }

    if (!is_valid_date(year, month, day))
    {
        return std::nullopt;
    }
    return PeriodKey::date(year, month, day);
}

std::optional<PeriodKey> parse_year_month(const std::string& text)
{
    std::string code = text;
    // Spreadsheet exports often render integer cells as floats
    if (code.size() == 8 && code.compare(6, 2, ".0") == 0)
    {
        code = code.substr(0, 6);
    }
    if (code.size() != 6 || !all_digits(code, 0, 6))
    {
        return std::nullopt;
    }

    const int year = to_int(code, 0, 4);
    const int month = to_int(code, 4, 2);
    if (year < kMinYear || year > kMaxYear || month < 1 || month > 12)
    {
        return std::nullopt;
    }
    return PeriodKey::year_month(year, month);
}

std::optional<PeriodKey> parse_fiscal_year(const std::string& text)
{
    std::string compact;
    for (char c : text)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
        {
            compact.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }

    // FY2024 names the year that ends in March 2024
    if (compact.size() == 6 && compact.compare(0, 2, "FY") == 0 && all_digits(compact, 2, 4))
    {
        const int end_year = to_int(compact, 2, 4);
        if (end_year - 1 < kMinYear || end_year - 1 > kMaxYear)
        {
            return std::nullopt;
        }
        return PeriodKey::fiscal_year(end_year - 1);
    }

    if (compact.size() != 7 || compact[4] != '-' ||
        !all_digits(compact, 0, 4) || !all_digits(compact, 5, 2))
    {
        return std::nullopt;
    }

    const int start = to_int(compact, 0, 4);
    const int suffix = to_int(compact, 5, 2);
    if (start < kMinYear || start > kMaxYear || suffix != (start + 1) % 100)
    {
        return std::nullopt;
    }
    return PeriodKey::fiscal_year(start);
}

} // namespace

bool is_valid_date(int year, int month, int day)
{
    if (year < kMinYear || year > kMaxYear || month < 1 || month > 12 || day < 1)
    {
        return false;
    }
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    int limit = days_in_month[month - 1];
    if (month == 2 && leap)
    {
        limit = 29;
    }
    return day <= limit;
}

PeriodKey PeriodKey::date(int year, int month, int day)
{
    if (!is_valid_date(year, month, day))
    {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    return PeriodKey(PeriodFormat::DATE, year, month, day);
}

PeriodKey PeriodKey::year_month(int year, int month)
{
    if (year < kMinYear || year > kMaxYear || month < 1 || month > 12)
    {
        throw std::invalid_argument("Invalid year-month: " + std::to_string(year) + "/" +
                                    std::to_string(month));
    }
    return PeriodKey(PeriodFormat::YEAR_MONTH, year, month, 0);
}

PeriodKey PeriodKey::fiscal_year(int start_year)
{
    if (start_year < kMinYear || start_year > kMaxYear)
    {
        throw std::invalid_argument("Invalid fiscal start year: " + std::to_string(start_year));
    }
    return PeriodKey(PeriodFormat::FISCAL_YEAR, start_year, 0, 0);
}

std::optional<PeriodKey> PeriodKey::parse(const std::string& text)
{
    const std::string value = trim(text);
    if (value.size() < 4 || value == "nan")
    {
        return std::nullopt;
    }

    if (auto key = parse_date(value))
    {
        return key;
    }
    if (auto key = parse_year_month(value))
    {
        return key;
    }
    return parse_fiscal_year(value);
}

int PeriodKey::month_index() const
{
    if (format_ == PeriodFormat::FISCAL_YEAR)
    {
        return (year_ + 1) * 12 + 2;
    }
    return year_ * 12 + (month_ - 1);
}

std::string PeriodKey::to_string() const
{
    std::ostringstream oss;
    oss << std::setfill('0');
    switch (format_)
    {
    case PeriodFormat::DATE:
        oss << std::setw(4) << year_ << '-' << std::setw(2) << month_ << '-' << std::setw(2) << day_;
        break;
    case PeriodFormat::YEAR_MONTH:
        oss << std::setw(4) << year_ << std::setw(2) << month_;
        break;
    case PeriodFormat::FISCAL_YEAR:
        oss << std::setw(4) << year_ << '-' << std::setw(2) << (year_ + 1) % 100;
        break;
    }
    return oss.str();
}

bool operator==(const PeriodKey& a, const PeriodKey& b)
{
    return a.format_ == b.format_ && a.year_ == b.year_ && a.month_ == b.month_ && a.day_ == b.day_;
}

bool operator!=(const PeriodKey& a, const PeriodKey& b)
{
    return !(a == b);
}

bool operator<(const PeriodKey& a, const PeriodKey& b)
{
    return std::tie(a.format_, a.year_, a.month_, a.day_) <
           std::tie(b.format_, b.year_, b.month_, b.day_);
}

bool operator>(const PeriodKey& a, const PeriodKey& b)
{
    return b < a;
}

bool operator<=(const PeriodKey& a, const PeriodKey& b)
{
    return !(b < a);
}

bool operator>=(const PeriodKey& a, const PeriodKey& b)
{
    return !(a < b);
}

bool at_or_before(const PeriodKey& key, const PeriodKey& cutoff)
{
    if (key.format() == cutoff.format())
    {
        return key <= cutoff;
    }
    return key.month_index() <= cutoff.month_index();
}

} // namespace schema
} // namespace fundmetrics

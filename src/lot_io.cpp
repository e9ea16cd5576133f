#include "lot_io.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace fillsched {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Split one CSV line; doubled quotes inside a quoted field are a literal quote.
static bool splitCsvLine(const std::string& line, std::vector<std::string>& fields) {
    fields.clear();
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
                else quoted = false;
            } else {
                cur.push_back(ch);
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (quoted) return false;
    fields.push_back(trim(cur));
    return true;
}

static int findColumn(const std::vector<std::string>& header, std::initializer_list<const char*> names) {
    for (size_t i = 0; i < header.size(); ++i) {
        std::string h = lower(header[i]);
        std::replace(h.begin(), h.end(), ' ', '_');
        for (const char* n : names) {
            if (h == n) return static_cast<int>(i);
        }
    }
    return -1;
}

static bool isBlank(const std::string& line) {
    return trim(line).empty();
}

bool parseLotCsv(std::istream& in, std::vector<RawLotRecord>& records, std::string& error) {
    records.clear();
    std::string line;
    int lineNumber = 0;
    std::vector<std::string> fields;

    int idCol = -1, typeCol = -1, vialsCol = -1;
    bool haveHeader = false;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (isBlank(line)) continue;
        if (!splitCsvLine(line, fields)) {
            error = "line " + std::to_string(lineNumber) + ": unterminated quoted field";
            return false;
        }
        if (!haveHeader) {
            if (!fields.empty() && fields[0].size() >= 3 && fields[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
                fields[0] = fields[0].substr(3);
            }
            idCol = findColumn(fields, {"lot_id", "id", "lotid"});
            typeCol = findColumn(fields, {"type", "lot_type"});
            vialsCol = findColumn(fields, {"vials", "vial_count"});
            if (idCol < 0 || typeCol < 0 || vialsCol < 0) {
                error = "line " + std::to_string(lineNumber) + ": header must name Lot ID, Type and Vials columns";
                return false;
            }
            haveHeader = true;
            continue;
        }
        auto field = [&](int col) { return col < static_cast<int>(fields.size()) ? fields[col] : std::string(); };
        records.push_back({field(idCol), field(typeCol), field(vialsCol)});
    }
    if (!haveHeader) {
        error = "input is empty (no header line)";
        return false;
    }
    return true;
}

bool parseSequence(std::istream& in, std::vector<std::string>& ids, std::string& error) {
    ids.clear();
    std::string line;
    int lineNumber = 0;
    int idCol = -1;
    bool first = true;
    std::vector<std::string> fields;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (isBlank(line) || trim(line)[0] == '#') continue;
        if (!splitCsvLine(line, fields)) {
            error = "line " + std::to_string(lineNumber) + ": unterminated quoted field";
            return false;
        }
        if (first) {
            first = false;
            idCol = findColumn(fields, {"lot_id", "id", "lotid"});
            if (idCol >= 0) continue;
            if (fields.size() > 1) {
                error = "line " + std::to_string(lineNumber) + ": CSV sequence needs a Lot ID column";
                return false;
            }
        }
        const std::string id = idCol >= 0 ? (idCol < static_cast<int>(fields.size()) ? fields[idCol] : "") : fields[0];
        if (!id.empty()) ids.push_back(id);
    }
    return true;
}

static std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string q = "\"";
    for (char c : s) {
        if (c == '"') q.push_back('"');
        q.push_back(c);
    }
    q.push_back('"');
    return q;
}

void writeScheduleCsv(std::ostream& out, const Schedule& schedule) {
    out << "Start,End,Hours,Activity,Lot ID,Type,Note\n";
    for (const auto& a : schedule.activities()) {
        std::ostringstream hours;
        hours << std::fixed << std::setprecision(2) << a.duration();
        out << formatTimestamp(a.start) << ',' << formatTimestamp(a.end) << ',' << hours.str() << ','
            << toString(a.kind) << ',' << csvField(a.lot ? a.lot->getId() : "") << ','
            << csvField(a.lot ? a.lot->getType() : "") << ',' << csvField(a.note) << '\n';
    }
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
static long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

static void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
}

static bool isLeap(long long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool parseTimestamp(const std::string& text, Hours& out) {
    const std::string s = trim(text);
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    char tail = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2d %2d:%2d%c", &y, &mo, &d, &h, &mi, &tail);
    if (n != 5) n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d%c", &y, &mo, &d, &h, &mi, &tail);
    if (n != 5) return false;
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (mo < 1 || mo > 12 || d < 1 || h < 0 || h > 23 || mi < 0 || mi > 59) return false;
    if (d > days[mo - 1] + (mo == 2 && isLeap(y) ? 1 : 0)) return false;
    out = static_cast<Hours>(daysFromCivil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d))) * 24.0 + h + mi / 60.0;
    return true;
}

std::string formatTimestamp(Hours t) {
    const long long minutes = static_cast<long long>(std::llround(t * 60.0));
    long long days = minutes / 1440;
    long long rem = minutes % 1440;
    if (rem < 0) { rem += 1440; --days; }
    long long y;
    unsigned m, d;
    civilFromDays(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld", y, m, d, rem / 60, rem % 60);
    return buf;
}

} // namespace fillsched

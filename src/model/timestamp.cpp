#include "judgecell/model/timestamp.hpp"
#include <fmt/core.h>
#include <ctime>
#include <regex>
#include <stdexcept>

namespace judgecell {
using namespace std;

timestamp now_timestamp() {
    return chrono::time_point_cast<chrono::milliseconds>(chrono::system_clock::now());
}

string format_timestamp(timestamp time) {
    auto ms = time.time_since_epoch().count();
    time_t seconds = ms / 1000;
    int millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }
    tm utc;
    gmtime_r(&seconds, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

timestamp parse_timestamp(const string &str) {
    static const regex pattern(R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(\.(\d+))?(Z|\+00:00)$)");
    smatch matches;
    if (!regex_match(str, matches, pattern))
        throw invalid_argument("Malformed timestamp " + str);

    tm utc{};
    utc.tm_year = stoi(matches[1].str()) - 1900;
    utc.tm_mon = stoi(matches[2].str()) - 1;
    utc.tm_mday = stoi(matches[3].str());
    utc.tm_hour = stoi(matches[4].str());
    utc.tm_min = stoi(matches[5].str());
    utc.tm_sec = stoi(matches[6].str());
    long long millis = 0;
    if (matches[8].matched) {
        string fraction = (matches[8].str() + "00").substr(0, 3);
        millis = stoll(fraction);
    }
    time_t seconds = timegm(&utc);
    return timestamp(chrono::milliseconds(static_cast<long long>(seconds) * 1000 + millis));
}

}  // namespace judgecell

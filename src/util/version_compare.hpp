#ifndef SENSISCAN_UTIL_VERSION_COMPARE_HPP
#define SENSISCAN_UTIL_VERSION_COMPARE_HPP

#include <string>
#include <vector>
#include <cctype>

namespace sensiscan {
namespace util {

/**
 * @brief Compare dotted model versions ("1.2.10" > "1.2.9"). A leading 'v' is
 *        ignored; non-numeric components compare as strings.
 * @return negative, zero or positive like strcmp.
 */
inline int compareVersions(const std::string &a, const std::string &b)
{
    auto split = [](const std::string &v) {
        std::vector<std::string> parts;
        size_t start = (!v.empty() && (v[0] == 'v' || v[0] == 'V')) ? 1 : 0;
        std::string cur;
        for (size_t i = start; i < v.size(); ++i) {
            if (v[i] == '.') {
                parts.push_back(cur);
                cur.clear();
            } else {
                cur.push_back(v[i]);
            }
        }
        parts.push_back(cur);
        return parts;
    };
    auto isNumber = [](const std::string &s) {
        if (s.empty() || s.size() > 18) {
            return false;
        }
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    };

    auto pa = split(a);
    auto pb = split(b);
    size_t n = pa.size() > pb.size() ? pa.size() : pb.size();
    for (size_t i = 0; i < n; ++i) {
        std::string x = i < pa.size() ? pa[i] : "0";
        std::string y = i < pb.size() ? pb[i] : "0";
        if (isNumber(x) && isNumber(y)) {
            long long nx = std::stoll(x);
            long long ny = std::stoll(y);
            if (nx != ny) {
                return nx < ny ? -1 : 1;
            }
        } else if (x != y) {
            return x < y ? -1 : 1;
        }
    }
    return 0;
}

} // namespace util
} // namespace sensiscan

#endif // SENSISCAN_UTIL_VERSION_COMPARE_HPP
